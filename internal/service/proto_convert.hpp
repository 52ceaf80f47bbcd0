#pragma once

#include "internal/model/media_node.hpp"
#include "medianode/manager/v1.hpp"

namespace medianode::service {

medianode::manager::v1::MediaNodeState ToProto(model::NodeState state);

// Throws std::invalid_argument for MEDIA_NODE_STATE_UNSPECIFIED.
model::NodeState FromProto(medianode::manager::v1::MediaNodeState state);

medianode::manager::v1::MediaNode ToProto(const model::MediaNode& node);
model::MediaNode                  FromProto(const medianode::manager::v1::MediaNode& node);

} // namespace medianode::service
