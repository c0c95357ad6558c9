#include "ocipush/registry/descriptor.hpp"

namespace ocipush::registry {

ContentKind content_kind(std::string_view media_type) noexcept {
    if (media_type == kMediaTypeOciManifest || media_type == kMediaTypeDockerManifest ||
        media_type == kMediaTypeDockerSchema1Manifest) {
        return ContentKind::Manifest;
    }
    if (media_type == kMediaTypeOciIndex || media_type == kMediaTypeDockerManifestList) {
        return ContentKind::Index;
    }
    if (media_type == kMediaTypeOciConfig || media_type == kMediaTypeDockerConfig) {
        return ContentKind::Config;
    }
    if (media_type.starts_with("application/vnd.oci.image.layer.") ||
        media_type.starts_with("application/vnd.docker.image.rootfs.")) {
        return ContentKind::Layer;
    }
    return ContentKind::Unknown;
}

bool is_manifest_kind(ContentKind kind) noexcept {
    return kind == ContentKind::Manifest || kind == ContentKind::Index;
}

std::string make_ref_key(const Descriptor& desc) {
    const char* prefix = "unknown-";
    switch (content_kind(desc.media_type)) {
    case ContentKind::Manifest: prefix = "manifest-"; break;
    case ContentKind::Index: prefix = "index-"; break;
    case ContentKind::Config: prefix = "config-"; break;
    case ContentKind::Layer: prefix = "layer-"; break;
    case ContentKind::Unknown: break;
    }
    return prefix + desc.digest.str();
}

} // namespace ocipush::registry
