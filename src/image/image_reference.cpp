/**
 * @file image_reference.cpp
 * @brief Transport prefix parsing of image references
 *
 * @date 2025
 */

#include "flashvm/image/image_reference.hpp"
#include "flashvm/utils/string_utils.hpp"

#include <cstring>

namespace flashvm {
namespace image {

namespace {

using utils::StringUtils;

// "<path>[:<tag>]" - the tag is whatever follows the last colon
void SplitPathAndTag(const std::string& rest, std::string& path, std::string& tag) {
    auto colon = rest.rfind(':');
    if (colon == std::string::npos) {
        path = rest;
        tag = kDefaultTag;
        return;
    }

    path = rest.substr(0, colon);
    tag = rest.substr(colon + 1);
    if (tag.empty()) {
        tag = kDefaultTag;
    }
}

} // anonymous namespace

ImageReference ImageReference::Parse(const std::string& reference) {
    ImageReference ref;
    ref.raw = reference;

    if (StringUtils::StartsWith(reference, kDockerPrefix)) {
        ref.transport = Transport::REMOTE_REGISTRY;
        ref.target = reference.substr(std::strlen(kDockerPrefix));
    } else if (StringUtils::StartsWith(reference, kStoragePrefix)) {
        ref.transport = Transport::LOCAL_STORE;
        ref.target = reference.substr(std::strlen(kStoragePrefix));
    } else if (StringUtils::StartsWith(reference, kOciArchivePrefix)) {
        // Checked before "oci:" - both share the prefix "oci"
        ref.transport = Transport::OCI_ARCHIVE;
        SplitPathAndTag(reference.substr(std::strlen(kOciArchivePrefix)), ref.target, ref.tag);
    } else if (StringUtils::StartsWith(reference, kOciPrefix)) {
        ref.transport = Transport::OCI_LAYOUT;
        SplitPathAndTag(reference.substr(std::strlen(kOciPrefix)), ref.target, ref.tag);
    } else if (StringUtils::StartsWith(reference, kDirPrefix)) {
        // Directory images carry no tag; colons belong to the path
        ref.transport = Transport::PLAIN_DIRECTORY;
        ref.target = reference.substr(std::strlen(kDirPrefix));
    } else {
        ref.transport = Transport::BARE_NAME;
        ref.target = reference;
    }

    return ref;
}

bool ImageReference::IsPathBased() const {
    return transport == Transport::OCI_LAYOUT ||
           transport == Transport::OCI_ARCHIVE ||
           transport == Transport::PLAIN_DIRECTORY;
}

const char* TransportName(Transport transport) {
    switch (transport) {
        case Transport::REMOTE_REGISTRY: return "remote-registry";
        case Transport::LOCAL_STORE: return "local-store";
        case Transport::OCI_LAYOUT: return "oci-layout";
        case Transport::OCI_ARCHIVE: return "oci-archive";
        case Transport::PLAIN_DIRECTORY: return "plain-directory";
        case Transport::BARE_NAME: return "bare-name";
    }
    return "unknown";
}

} // namespace image
} // namespace flashvm
