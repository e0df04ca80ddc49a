#ifndef TAGDEN_TAGDEN_HPP_
#define TAGDEN_TAGDEN_HPP_

#include <tagden/tagden_export.h>
#include <tagden/types.hpp>
#include <tagden/report.hpp>
#include <tagden/pixel.hpp>
#include <tagden/surface.hpp>
#include <tagden/path.hpp>
#include <tagden/archive.hpp>
#include <tagden/extractor.hpp>
#include <tagden/codecs/packed_image.hpp>
#include <tagden/codecs/png.hpp>

namespace tagden {

// All public API is included via the headers above.
// See:
//   - types.hpp:     error_code, result, decode_options
//   - report.hpp:    reporter, stream_reporter, null_reporter
//   - pixel.hpp:     unpack_rgb555
//   - surface.hpp:   surface, memory_surface
//   - path.hpp:      normalize_path
//   - archive.hpp:   directory_entry, archive_reader, read_directory
//   - extractor.hpp: extract_options, extract_entry, extract_all, run
//   - codecs/*.hpp:  packed image decoder, PNG encoder

} // namespace tagden

#endif // TAGDEN_TAGDEN_HPP_
