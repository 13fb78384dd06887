/*
 * Copyright 2019 Google LLC
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "pack/mask_map.h"

#include <vector>
#include "common/disk_util.h"
#include "common/scheduler.h"
#include "pack/image_source.h"
#include "pack/naming.h"
#include "pack/packed_image.h"
#include "pack/packer.h"
#include "process/image.h"

namespace mmp {
namespace {
bool LoadSource(const std::string& path, Logger* logger, GrayImage* out_gray) {
  std::vector<uint8_t> file_data;
  if (!ReadBinary(path, &file_data)) {
    Log<MMP_ERROR_IO_READ_IMAGE>(logger, "", path.c_str());
    return false;
  }
  Image image;
  if (!image.Read(file_data.data(), file_data.size(), logger)) {
    Log<MMP_ERROR_IMAGE_DECODE>(logger, "", path.c_str());
    return false;
  }
  out_gray->CopyFrom(image);
  return true;
}

bool HasStompedSource(const PackSettings& settings, const std::string& dst_path,
                      Logger* logger) {
  for (size_t i = 0; i != kMaskSlotCount; ++i) {
    const std::string& src_path =
        settings.GetSourcePath(static_cast<MaskSlot>(i));
    if (!src_path.empty() && IsSameFile(src_path, dst_path)) {
      Log<MMP_ERROR_STOMP>(logger, "", dst_path.c_str());
      return true;
    }
  }
  return false;
}

void PackMaskMapImpl(const PackSettings& settings,
                     const std::string& dst_path, Logger* logger) {
  Logger* const timing_logger = settings.print_timing ? logger : nullptr;
  const std::string out_path =
      dst_path.empty() ? GetDefaultOutputPath(settings) : dst_path;
  if (HasStompedSource(settings, out_path, logger)) {
    return;
  }

  // Load sources, leaving slots that fail to load unassigned.
  GrayImage grays[kMaskSlotCount];
  PackRequest request;
  request.invert_smoothness = settings.invert_smoothness;
  {
    ProfileSentry load_sentry(timing_logger, "Load");
    for (size_t i = 0; i != kMaskSlotCount; ++i) {
      const MaskSlot slot = static_cast<MaskSlot>(i);
      ChannelSpec& channel = request.ModifyChannel(slot);
      channel.fallback = settings.GetFallback(slot);
      const std::string& src_path = settings.GetSourcePath(slot);
      if (src_path.empty()) {
        continue;
      }
      Logger::NameSentry name_sentry(logger, GetMaskSlotName(slot));
      if (LoadSource(src_path, logger, &grays[i])) {
        channel.source = &grays[i];
      }
    }
  }

  SizeResolution resolution;
  if (ResolveSize(request, &resolution) != kPackStatusOk) {
    for (size_t i = 0; i != kMaskSlotCount; ++i) {
      const MaskSlot slot = static_cast<MaskSlot>(i);
      const ImageSource* const source = request.GetChannel(slot).source;
      if (source && (source->GetWidth() <= 0 || source->GetHeight() <= 0)) {
        Logger::NameSentry name_sentry(logger, GetMaskSlotName(slot));
        Log<MMP_ERROR_INVALID_DIMENSIONS>(
            logger, "", settings.GetSourcePath(slot).c_str(),
            source->GetWidth(), source->GetHeight());
      }
    }
    return;
  }

  bool any_source = false;
  for (size_t i = 0; i != kMaskSlotCount; ++i) {
    const MaskSlot slot = static_cast<MaskSlot>(i);
    ChannelSpec& channel = request.ModifyChannel(slot);
    if (!channel.IsPresent()) {
      continue;
    }
    any_source = true;
    if (resolution.IsDropped(slot)) {
      Logger::NameSentry name_sentry(logger, GetMaskSlotName(slot));
      Log<MMP_WARN_SIZE_MISMATCH>(
          logger, "", settings.GetSourcePath(slot).c_str(),
          channel.source->GetWidth(), channel.source->GetHeight(),
          resolution.width, resolution.height);
      channel.source = nullptr;
    }
  }
  if (!any_source) {
    Log<MMP_INFO_DEFAULT_SIZE>(
        logger, "", resolution.width, resolution.height);
  }

  PackedImage packed;
  {
    ProfileSentry composite_sentry(timing_logger, "Composite");
    Scheduler scheduler;
    scheduler.Start(settings.worker_count);
    const PackStatus status = Composite(
        request, resolution.width, resolution.height, &packed, &scheduler);
    scheduler.Stop();
    if (status != kPackStatusOk) {
      Log<MMP_ERROR_INVALID_OUTPUT_DIMENSIONS>(
          logger, "", resolution.width, resolution.height);
      return;
    }
  }

  Image image;
  packed.CopyTo(&image);
  CreateDirectoryForFile(out_path);
  {
    ProfileSentry write_sentry(timing_logger, "Write");
    if (!image.Write(out_path.c_str(), settings.png_level, logger)) {
      return;
    }
  }
  Log<MMP_INFO_SAVED>(logger, "", out_path.c_str());
}
}  // namespace

bool PackMaskMap(const PackSettings& settings, const std::string& dst_path,
                 Logger* logger) {
  try {
    ProfileSentry profile_sentry(
        settings.print_timing ? logger : nullptr, "Pack");
    const size_t old_error_count = logger->GetErrorCount();
    PackMaskMapImpl(settings, dst_path, logger);
    return logger->GetErrorCount() == old_error_count;
  } catch (const AssertException& e) {
    Log<MMP_ERROR_ASSERT>(
        logger, "", e.GetFile(), e.GetLine(), e.GetExpression());
    return false;
  }
}
}  // namespace mmp
