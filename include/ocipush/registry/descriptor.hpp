#pragma once

#include <string>
#include <string_view>

#include "ocipush/core/types.hpp"
#include "ocipush/digest/digest.hpp"

namespace ocipush::registry {
    using u64 = ocipush::core::u64;

    inline constexpr std::string_view kMediaTypeOciManifest = "application/vnd.oci.image.manifest.v1+json";
    inline constexpr std::string_view kMediaTypeOciIndex = "application/vnd.oci.image.index.v1+json";
    inline constexpr std::string_view kMediaTypeOciConfig = "application/vnd.oci.image.config.v1+json";
    inline constexpr std::string_view kMediaTypeOciLayer = "application/vnd.oci.image.layer.v1.tar";
    inline constexpr std::string_view kMediaTypeOciLayerGzip = "application/vnd.oci.image.layer.v1.tar+gzip";
    inline constexpr std::string_view kMediaTypeOciLayerZstd = "application/vnd.oci.image.layer.v1.tar+zstd";
    inline constexpr std::string_view kMediaTypeDockerManifest = "application/vnd.docker.distribution.manifest.v2+json";
    inline constexpr std::string_view kMediaTypeDockerSchema1Manifest = "application/vnd.docker.distribution.manifest.v1+prettyjws";
    inline constexpr std::string_view kMediaTypeDockerManifestList = "application/vnd.docker.distribution.manifest.list.v2+json";
    inline constexpr std::string_view kMediaTypeDockerConfig = "application/vnd.docker.container.image.v1+json";
    inline constexpr std::string_view kMediaTypeDockerLayerGzip = "application/vnd.docker.image.rootfs.diff.tar.gzip";

    // Repository inside a registry, as produced by the reference parser.
    struct Repository {
        std::string registry;   // Registry (account) id
        std::string name;       // Repository name, e.g. "team/app"
    };

    struct Descriptor {
        std::string media_type;
        ocipush::digest::Digest digest;
        u64 size{0};
    };

    enum class ContentKind : ocipush::core::u8 {
        Unknown = 0,
        Manifest,
        Index,
        Config,
        Layer,
    };

    [[nodiscard]] ContentKind content_kind(std::string_view media_type) noexcept;

    // Manifests and indexes go through put_manifest, everything else is a blob.
    [[nodiscard]] bool is_manifest_kind(ContentKind kind) noexcept;

    // Stable key for status tracking: "<kind>-<digest>", e.g.
    // "layer-sha256:9f86...".
    [[nodiscard]] std::string make_ref_key(const Descriptor& desc);

} // namespace ocipush::registry
