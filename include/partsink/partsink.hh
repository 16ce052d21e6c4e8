#pragma once

#include "partsink.types.h"
#include "partsink/address.source.hh"
#include "partsink/csv.encoder.hh"
#include "partsink/errors.hh"
#include "partsink/file.upload.client.hh"
#include "partsink/jsonlines.encoder.hh"
#include "partsink/lines.encoder.hh"
#include "partsink/memory.upload.client.hh"
#include "partsink/s3.upload.client.hh"
#include "partsink/settings.hh"
#include "partsink/upload.forever.hh"
#include "partsink/upload.hh"

namespace partsink {
/**
 * @brief Set the minimum level of messages written to the log.
 * @throws InvalidSettings if @p level is not a valid log level.
 */
void
set_log_level(PartsinkLogLevel level);

PartsinkLogLevel
get_log_level();
} // namespace partsink
