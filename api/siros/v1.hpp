#pragma once

#include "siros/v1/resource.grpc.pb.h"
#include "siros/v1/resource.pb.h"
