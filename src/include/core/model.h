#pragma once

#include "model/device_info.h"
#include "model/device_type.h"
#include "model/dto/file_dto.h"
#include "model/dto/multicast_dto.h"
#include "model/dto/prepare_upload_dto.h"
#include "model/error.h"
#include "model/feedback.h"
#include "model/file_status.h"
#include "model/file_type.h"
#include "model/security_context.h"
#include "model/session_status.h"
#include "model/transfer_event.h"
