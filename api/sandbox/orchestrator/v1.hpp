#pragma once

#include "sandbox/orchestrator/v1/types.pb.h"
#include "sandbox/orchestrator/v1/job_payloads.pb.h"

#include "sandbox/orchestrator/v1/queue_service.pb.h"
#include "sandbox/orchestrator/v1/presence_service.pb.h"
#include "sandbox/orchestrator/v1/production_service.pb.h"
#include "sandbox/orchestrator/v1/project_service.pb.h"

#include "sandbox/orchestrator/v1/queue_service.grpc.pb.h"
#include "sandbox/orchestrator/v1/presence_service.grpc.pb.h"
#include "sandbox/orchestrator/v1/production_service.grpc.pb.h"
#include "sandbox/orchestrator/v1/project_service.grpc.pb.h"
