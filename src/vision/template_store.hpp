#pragma once
// =============================================================================
// テンプレートストア - 画像ディレクトリからの Gray8 テンプレート読込 + キャッシュ
// =============================================================================
#include "result.hpp"
#include "vision/gray_image.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace menupilot::vision {

struct TemplateHandle {
    std::string template_id;            // 画像ファイル名 (例: "btn_solo.png")
    GrayImage image;
    std::string source_path_utf8;
    uint32_t checksum = 0;              // FNV-1a (ピクセル)
};

class TemplateStore {
public:
    explicit TemplateStore(std::string images_dir = "images");

    // キャッシュ済みならそれを返し、未読込なら <images_dir>/<id> を読み込む。
    // 読込失敗はキャッシュせず、毎回エラーを返す。
    Result<const TemplateHandle*> load(const std::string& template_id);

    // 直接Gray8データを登録（テスト・キャプチャ済み画像用）
    Result<void> registerGray8(const std::string& template_id, const uint8_t* gray_data,
                               int w, int h, const std::string& src_path_utf8 = "");

    const TemplateHandle* get(const std::string& template_id) const;
    bool contains(const std::string& template_id) const { return map_.count(template_id) > 0; }
    std::vector<std::string> listTemplateIds() const;
    void clear() { map_.clear(); }
    void remove(const std::string& template_id) { map_.erase(template_id); }
    size_t size() const { return map_.size(); }

    std::string resolvePath(const std::string& template_id) const;
    const std::string& imagesDir() const { return images_dir_; }

    // ディスク上に存在しないテンプレート一覧（環境検証用）
    std::vector<std::string> missingTemplates(const std::vector<std::string>& ids) const;

private:
    std::string images_dir_;
    std::unordered_map<std::string, TemplateHandle> map_;
};

} // namespace menupilot::vision
