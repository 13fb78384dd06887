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

#ifndef MMP_MSG0
#define MMP_MSG0(severity, id, format, ...) MMP_MSG(severity, id, format)
#define MMP_MSG1(severity, id, format, ...) MMP_MSG(severity, id, format)
#define MMP_MSG2(severity, id, format, ...) MMP_MSG(severity, id, format)
#define MMP_MSG3(severity, id, format, ...) MMP_MSG(severity, id, format)
#define MMP_MSG4(severity, id, format, ...) MMP_MSG(severity, id, format)
#define MMP_MSG5(severity, id, format, ...) MMP_MSG(severity, id, format)
#define MMP_MSG6(severity, id, format, ...) MMP_MSG(severity, id, format)
#endif  // MMP_MSG0

MMP_MSG3(ERROR, ASSERT                       , "%s(%d) : ASSERT(%s)", const char*, file, int, line, const char*, expression)
MMP_MSG1(ERROR, ARGUMENT_UNKNOWN             , "Unknown flag: %s", const char*, text)
MMP_MSG1(ERROR, ARGUMENT_PATHS               , "Too many paths (%zu). Expected at most one output path.", size_t, count)
MMP_MSG2(ERROR, ARGUMENT_EXCEPTION           , "%s: %s", const char*, id, const char*, err)
MMP_MSG4(ERROR, ARGUMENT_RANGE               , "--%s must be in the range [%g, %g], got: %g", const char*, name, double, min, double, max, double, value)
MMP_MSG1(ERROR, IO_READ_IMAGE                , "Cannot read image: \"%s\"", const char*, path)
MMP_MSG1(ERROR, IO_WRITE_IMAGE               , "Cannot write image: \"%s\"", const char*, path)
MMP_MSG1(ERROR, STOMP                        , "Would stomp source file: \"%s\"", const char*, path)
MMP_MSG1(ERROR, IMAGE_DECODE                 , "Cannot decode image: \"%s\"", const char*, path)
MMP_MSG3(ERROR, INVALID_DIMENSIONS           , "Texture '%s' has invalid size %dx%d.", const char*, path, int, width, int, height)
MMP_MSG2(ERROR, INVALID_OUTPUT_DIMENSIONS    , "Invalid output size %dx%d.", int, width, int, height)
MMP_MSG5(WARN , SIZE_MISMATCH                , "Texture '%s' size %dx%d does not match required size %dx%d. It will be ignored.", const char*, path, int, width, int, height, int, required_width, int, required_height)
MMP_MSG2(INFO , DEFAULT_SIZE                 , "No textures assigned. Using default texture size: %dx%d", int, width, int, height)
MMP_MSG2(INFO , TIMING                       , "%s: Completed in %.3f seconds.", const char*, label, double, seconds)
MMP_MSG1(INFO , SAVED                        , "Mask map saved to: %s", const char*, path)
MMP_MSG0(ERROR, IMAGE_FALLBACK_DECODE        , "Failed decoding image with fallback decoder.")
MMP_MSG1(ERROR, GIF_RECORD_TYPE              , "GIF: Failed getting record type. Error code: %d", int, code)
MMP_MSG1(ERROR, GIF_IMAGE_DESC               , "GIF: Failed getting image desc. Error code: %d", int, code)
MMP_MSG1(ERROR, GIF_EXTENSION                , "GIF: Failed getting extension. Error code: %d", int, code)
MMP_MSG0(ERROR, GIF_BAD_GCB                  , "GIF: Invalid Graphics Control Block (GCB).")
MMP_MSG0(ERROR, GIF_NO_RECORDS               , "GIF: No image records.")
MMP_MSG1(ERROR, GIF_OPEN                     , "GIF: Failed opening with error code: %d", int, code)
MMP_MSG1(ERROR, GIF_READ_LINE                , "GIF: Failed reading image line. Error code: %d", int, code)
MMP_MSG2(ERROR, GIF_BAD_SIZE                 , "GIF: Unexpected image size: <%d, %d>", int, width, int, height)
MMP_MSG6(ERROR, GIF_FRAME_BOUNDS             , "GIF: Frame 0 bounds <%u, %u>-<%u, %u> exceeds image size <%u, %u>", uint32_t, x0, uint32_t, y0, uint32_t, x1, uint32_t, y1, uint32_t, width, uint32_t, height)
MMP_MSG1(ERROR, JPG_DECODE_HEADER            , "JPG: Failed decoding header with error: %s", const char*, info)
MMP_MSG1(ERROR, JPG_DECOMPRESS               , "JPG: Failed decompressing with error: %s", const char*, info)
MMP_MSG1(ERROR, PNG_DECODE                   , "PNG: %s", const char*, info)
MMP_MSG1(WARN , PNG_DECODE                   , "PNG: %s", const char*, info)
MMP_MSG1(ERROR, PNG_ENCODE                   , "PNG: %s", const char*, info)
MMP_MSG1(WARN , PNG_ENCODE                   , "PNG: %s", const char*, info)
MMP_MSG0(ERROR, PNG_READ_INIT                , "PNG: Failed to initialize for read.")
MMP_MSG2(ERROR, PNG_READ_SHORT               , "PNG: Attempt to read %zu bytes, only %zu remain.", size_t, size, size_t, remain)
MMP_MSG0(ERROR, PNG_WRITE_INIT               , "PNG: Failed to initialize for write.")

#undef MMP_MSG
#undef MMP_MSG0
#undef MMP_MSG1
#undef MMP_MSG2
#undef MMP_MSG3
#undef MMP_MSG4
#undef MMP_MSG5
#undef MMP_MSG6
