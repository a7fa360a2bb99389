#include "../../include/image_codec.hpp"
#include <algorithm>

namespace imgsan {

namespace {

constexpr std::size_t kMaxTextValue = 128;

std::string block_value(const MetadataBlock& block) {
    switch (block.kind) {
        case BlockKind::Comment:
        case BlockKind::Text:
        case BlockKind::Timestamp: {
            std::string text(block.data.begin(), block.data.end());
            if (text.size() > kMaxTextValue) {
                text.resize(kMaxTextValue);
                text += "...";
            }
            return text;
        }
        default:
            return "<" + std::to_string(block.data.size()) + " bytes>";
    }
}

bool drops_block(const MetadataBlock& block, const std::set<std::string>& keys) {
    if (block.kind == BlockKind::Exif) return false;
    if (keys.contains(block_key(block))) return true;
    if (block.kind == BlockKind::Xmp && keys.contains("Xmp")) return true;
    if (keys.contains("Preview") && block.kind != BlockKind::Icc && contains_embedded_jpeg(block.data)) {
        return true;
    }
    return false;
}

} // namespace

StripPlan plan_strip(const ImageHandle& handle, const std::set<std::string>& keys) {
    StripPlan plan;
    const auto& blocks = handle.blocks();
    plan.actions.assign(blocks.size(), BlockAction::Keep);
    plan.rewritten.resize(blocks.size());

    for (std::size_t i = 0; i < blocks.size(); ++i) {
        const auto& block = blocks[i];
        if (block.kind == BlockKind::Exif) {
            const auto* exif = handle.exif_at(i);
            if (exif && exif->matches_any(keys)) {
                plan.rewritten[i] = exif->strip(keys, &plan.removed);
                plan.actions[i] = BlockAction::Rewrite;
            }
            continue;
        }
        if (drops_block(block, keys)) {
            plan.actions[i] = BlockAction::Drop;
            plan.removed.push_back(block_key(block));
        }
    }

    // the same key can be removed from several Exif blocks
    std::vector<std::string> unique;
    for (auto& key : plan.removed) {
        if (std::find(unique.begin(), unique.end(), key) == unique.end()) unique.push_back(std::move(key));
    }
    plan.removed = std::move(unique);
    return plan;
}

std::vector<MetadataEntry> collect_entries(const ImageHandle& handle) {
    std::vector<MetadataEntry> entries;
    const auto& blocks = handle.blocks();
    for (std::size_t i = 0; i < blocks.size(); ++i) {
        if (blocks[i].kind == BlockKind::Exif) {
            if (const auto* exif = handle.exif_at(i)) {
                for (const auto& e : exif->entries()) {
                    entries.push_back({e.key, e.value});
                }
            }
            continue;
        }
        entries.push_back({block_key(blocks[i]), block_value(blocks[i])});
    }
    return entries;
}

} // namespace imgsan
