#pragma once

#include "medianode/manager/v1/media_node.pb.h"
#include "medianode/manager/v1/media_node_service.pb.h"
#include "medianode/manager/v1/provisioning_service.pb.h"
