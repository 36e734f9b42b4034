#pragma once

/*
 * UUIDCodec - UUID v1/v4/v7 generation and decoding.
 *
 *   EasyUUID      string-level generator (batches, bulk output)
 *   UUIDGen       byte-level generator with injectable entropy and clock
 *   UUIDDecoder   structural decoding of any string
 *   UUIDTimestamp ISO-8601 rendering of v1/v7 timestamps
 *   UUIDFormat    shared hex/hyphen validation and conversion
 *   UUIDConfig    YAML settings for bulk generation
 *   UUIDLog       spdlog logger used by the library
 */

#include "UUIDFormat.h"
#include "UUIDGen.h"
#include "EasyUUID.h"
#include "UUIDDecoder.h"
#include "UUIDTimestamp.h"
#include "UUIDConfig.h"
#include "UUIDLog.h"
