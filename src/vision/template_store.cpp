// =============================================================================
// テンプレートストア - stb_image 読込 + Gray8 キャッシュ
// =============================================================================
#include "vision/template_store.hpp"
#include "vision/image_codec.hpp"
#include "menupilot_log.hpp"

#include <algorithm>
#include <filesystem>

static constexpr const char* TAG = "TplStore";

namespace menupilot::vision {

static uint32_t fnv1a32(const uint8_t* d, size_t n) {
    uint32_t h = 2166136261u;
    for (size_t i = 0; i < n; ++i) h = (h ^ d[i]) * 16777619u;
    return h;
}

TemplateStore::TemplateStore(std::string images_dir)
    : images_dir_(std::move(images_dir)) {}

std::string TemplateStore::resolvePath(const std::string& template_id) const {
    if (images_dir_.empty()) return template_id;
    return (std::filesystem::path(images_dir_) / template_id).string();
}

Result<const TemplateHandle*> TemplateStore::load(const std::string& template_id) {
    if (template_id.empty()) {
        return Err<const TemplateHandle*>("template_id is empty");
    }

    auto it = map_.find(template_id);
    if (it != map_.end()) {
        return Ok(static_cast<const TemplateHandle*>(&it->second));
    }

    std::string path = resolvePath(template_id);
    auto decoded = decodeFileToGray(path);
    if (decoded.is_err()) {
        MPLOG_ERROR(TAG, "テンプレート読込失敗: %s (%s)", template_id.c_str(),
                    decoded.error().message.c_str());
        return Err<const TemplateHandle*>(decoded.error().message);
    }

    TemplateHandle th;
    th.template_id = template_id;
    th.image = std::move(decoded).value();
    th.source_path_utf8 = path;
    th.checksum = fnv1a32(th.image.pixels.data(), th.image.pixels.size());

    MPLOG_DEBUG(TAG, "テンプレート読込: %s %dx%d", template_id.c_str(),
                th.image.width, th.image.height);

    auto [pos, inserted] = map_.emplace(template_id, std::move(th));
    (void)inserted;
    return Ok(static_cast<const TemplateHandle*>(&pos->second));
}

Result<void> TemplateStore::registerGray8(const std::string& template_id,
                                          const uint8_t* gray_data,
                                          int w, int h,
                                          const std::string& src_path_utf8) {
    if (template_id.empty()) return Err<void>("template_id is empty");
    if (!gray_data) return Err<void>("gray_data=null");
    if (w <= 0 || h <= 0) return Err<void>("invalid size");

    TemplateHandle th;
    th.template_id = template_id;
    th.image.width = w;
    th.image.height = h;
    th.image.pixels.assign(gray_data, gray_data + (size_t)w * h);
    th.source_path_utf8 = src_path_utf8;
    th.checksum = fnv1a32(th.image.pixels.data(), th.image.pixels.size());

    map_[template_id] = std::move(th);
    MPLOG_DEBUG(TAG, "テンプレート登録: %s %dx%d", template_id.c_str(), w, h);
    return Ok();
}

const TemplateHandle* TemplateStore::get(const std::string& template_id) const {
    auto it = map_.find(template_id);
    if (it == map_.end()) return nullptr;
    return &it->second;
}

std::vector<std::string> TemplateStore::listTemplateIds() const {
    std::vector<std::string> ids;
    ids.reserve(map_.size());
    for (auto& kv : map_) ids.push_back(kv.first);
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::vector<std::string> TemplateStore::missingTemplates(const std::vector<std::string>& ids) const {
    std::vector<std::string> missing;
    for (const auto& id : ids) {
        if (contains(id)) continue;
        std::error_code ec;
        if (!std::filesystem::exists(resolvePath(id), ec) &&
            std::find(missing.begin(), missing.end(), id) == missing.end()) {
            missing.push_back(id);
        }
    }
    return missing;
}

} // namespace menupilot::vision
