#ifndef GWD_IMAGE_GWD_IMAGE_HPP_
#define GWD_IMAGE_GWD_IMAGE_HPP_

#include <gwd_image/gwd_image_export.h>
#include <gwd_image/types.hpp>
#include <gwd_image/surface.hpp>
#include <gwd_image/raster.hpp>
#include <gwd_image/codec.hpp>
#include <gwd_image/batch.hpp>
#include <gwd_image/codecs/gwd.hpp>
#include <gwd_image/codecs/png.hpp>

namespace gwd_image {

// All public API is included via the headers above.
// See:
//   - types.hpp:    pixel_format, decode_error, decode_result, decode_options
//   - surface.hpp:  surface interface, memory_surface
//   - raster.hpp:   channel-exact sample grid used by the GWD codec
//   - codec.hpp:    decoder, codec_registry, decode()
//   - batch.hpp:    directory conversion GWD <-> PNG
//   - codecs/*.hpp: Individual codec implementations

} // namespace gwd_image

#endif // GWD_IMAGE_GWD_IMAGE_HPP_
