// SPDX-License-Identifier: Apache-2.0
// File:        publictypes.h
// Description: Types used in both the public and internal interfaces.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
// http://www.apache.org/licenses/LICENSE-2.0
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef TESSPIPE_PUBLICTYPES_H_
#define TESSPIPE_PUBLICTYPES_H_

namespace tesspipe {

/**
 * Possible modes for page layout analysis, as understood by the engine's
 * --psm argument.
 */
enum PageSegMode {
  PSM_OSD_ONLY = 0,       ///< Orientation and script detection only.
  PSM_AUTO_OSD = 1,       ///< Automatic page segmentation with orientation and
                          ///< script detection. (OSD)
  PSM_AUTO_ONLY = 2,      ///< Automatic page segmentation, but no OSD, or OCR.
  PSM_AUTO = 3,           ///< Fully automatic page segmentation, but no OSD.
  PSM_SINGLE_COLUMN = 4,  ///< Assume a single column of text of variable sizes.
  PSM_SINGLE_BLOCK_VERT_TEXT = 5, ///< Assume a single uniform block of
                                  ///< vertically aligned text.
  PSM_SINGLE_BLOCK = 6,   ///< Assume a single uniform block of text.
  PSM_SINGLE_LINE = 7,    ///< Treat the image as a single text line.
  PSM_SINGLE_WORD = 8,    ///< Treat the image as a single word.
  PSM_CIRCLE_WORD = 9,    ///< Treat the image as a single word in a circle.
  PSM_SINGLE_CHAR = 10,   ///< Treat the image as a single character.
  PSM_SPARSE_TEXT = 11,   ///< Find as much text as possible in no particular order.
  PSM_SPARSE_TEXT_OSD = 12, ///< Sparse text with orientation and script det.
  PSM_RAW_LINE = 13,      ///< Treat the image as a single text line, bypassing
                          ///< hacks that are Tesseract-specific.

  PSM_COUNT               ///< Number of enum entries.
};

/**
 * Recognizer selection, as understood by the engine's --oem argument.
 */
enum OcrEngineMode {
  OEM_TESSERACT_ONLY,          ///< Run Tesseract only - fastest; deprecated
  OEM_LSTM_ONLY,               ///< Run just the LSTM line recognizer.
  OEM_TESSERACT_LSTM_COMBINED, ///< Run the LSTM recognizer, but allow fallback
                               ///< to Tesseract when things get difficult.
  OEM_DEFAULT,                 ///< Let the engine pick, based on what the
                               ///< installed traineddata supports.
  OEM_COUNT                    ///< Number of OEMs
};

/**
 * Output configurations the engine can write. Each one but FILE_FORMAT_OSD
 * names a config file of the same (lowercase) name in tessdata/configs.
 */
enum FileFormat {
  FILE_FORMAT_TXT,
  FILE_FORMAT_HOCR,
  FILE_FORMAT_PDF,
  FILE_FORMAT_TSV,
  FILE_FORMAT_ALTO,
  FILE_FORMAT_OSD,
};

} // namespace tesspipe

#endif // TESSPIPE_PUBLICTYPES_H_
