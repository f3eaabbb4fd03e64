#pragma once

#include "modsync/v1/image.pb.h"
#include "modsync/v1/registry.pb.h"

#include "modsync/v1/image.grpc.pb.h"
#include "modsync/v1/registry.grpc.pb.h"
