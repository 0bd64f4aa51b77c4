#pragma once

#include "durable/v1/checkpoint.pb.h"
#include "durable/v1/id.pb.h"
#include "durable/v1/record.pb.h"
