//===-- codec.cpp - compression stream transforms -------------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of tek-wharf, under the GNU General Public License v3.0 or later
// See https://github.com/teknology-hub/tek-wharf/blob/main/COPYING for
//    license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Implementation of @ref tek::wharf::make_decompressor and
///    @ref tek::wharf::make_compressor.
///
//===----------------------------------------------------------------------===//
#include "codec.hpp"

#include "common/error.h"
#include "config.h" // IWYU pragma: keep
#include "stream.hpp"
#include "tek-wharf/base.h"
#include "tek-wharf/error.h"
#include "zlib_api.h" // IWYU pragma: keep

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <utility>

#ifdef TEK_WHB_BROTLI
#include <brotli/decode.h>
#include <brotli/encode.h>
#endif // def TEK_WHB_BROTLI
#ifdef TEK_WHB_ZSTD
#include <zstd.h>
#include <zstd_errors.h>
#endif // def TEK_WHB_ZSTD

namespace tek::wharf {

namespace {

//===-- Private constants -------------------------------------------------===//

/// Size of the intermediate buffers used by the transforms, in bytes.
static constexpr std::size_t chunk_size = 64 * 1024;

//===-- Private types -----------------------------------------------------===//

//===--- Pass-through -----------------------------------------------------===//

/// Source returning data from another source unchanged.
class passthrough_source final : public source {
  source &upstream;

public:
  constexpr passthrough_source(source &upstream) noexcept
      : upstream{upstream} {}

  tek_wh_err read(void *_Nonnull buf, std::size_t size,
                  std::size_t &num_read) override {
    return upstream.read(buf, size, num_read);
  }
};

/// Sink writing data to another sink unchanged.
class passthrough_sink final : public sink {
  sink &downstream;

public:
  constexpr passthrough_sink(sink &downstream) noexcept
      : downstream{downstream} {}

  tek_wh_err write(const void *_Nonnull buf, std::size_t size) override {
    return downstream.write(buf, size);
  }
  tek_wh_err finish() override { return twh_err_ok(); }
};

/// Base for decompressing sources, managing the compressed input buffer.
class input_buffered_source : public source {
protected:
  source &upstream;
  /// Buffer for compressed input.
  std::unique_ptr<unsigned char[]> in_buf{new unsigned char[chunk_size]};
  /// Value indicating whether @ref upstream has reached its end.
  bool upstream_eof{};
  /// Value indicating whether any input has been received.
  bool got_input{};

  constexpr input_buffered_source(source &upstream) noexcept
      : upstream{upstream} {}

  /// Read the next chunk of compressed input into @ref in_buf.
  ///
  /// @param [out] num_read
  ///    Variable that receives the number of bytes read.
  /// @return A @ref tek_wh_err indicating the result of operation.
  tek_wh_err refill(std::size_t &num_read) {
    if (const auto res = upstream.read(in_buf.get(), chunk_size, num_read);
        !tek_wh_err_success(&res)) {
      return res;
    }
    if (num_read < chunk_size) {
      upstream_eof = true;
    }
    if (num_read) {
      got_input = true;
    }
    return twh_err_ok();
  }
};

#ifdef TEK_WHB_BROTLI

//===--- Brotli -----------------------------------------------------------===//

/// Brotli decompressing source.
class brotli_source final : public input_buffered_source {
  std::unique_ptr<BrotliDecoderState, decltype(&BrotliDecoderDestroyInstance)>
      state{BrotliDecoderCreateInstance(nullptr, nullptr, nullptr),
            BrotliDecoderDestroyInstance};
  const std::uint8_t *_Nullable next_in{};
  std::size_t avail_in{};
  /// Value indicating whether the end of compressed stream has been decoded.
  bool finished{};

public:
  brotli_source(source &upstream) : input_buffered_source{upstream} {}

  constexpr bool valid() const noexcept { return state != nullptr; }

  tek_wh_err read(void *_Nonnull buf, std::size_t size,
                  std::size_t &num_read) override {
    auto next_out = reinterpret_cast<std::uint8_t *>(buf);
    std::size_t avail_out = size;
    while (avail_out && !finished) {
      if (!avail_in && !upstream_eof) {
        if (const auto res = refill(avail_in); !tek_wh_err_success(&res)) {
          return res;
        }
        next_in = in_buf.get();
      }
      if (!avail_in && upstream_eof && !got_input) {
        // Empty body
        break;
      }
      switch (BrotliDecoderDecompressStream(state.get(), &avail_in, &next_in,
                                            &avail_out, &next_out, nullptr)) {
      case BROTLI_DECODER_RESULT_SUCCESS:
        finished = true;
        break;
      case BROTLI_DECODER_RESULT_NEEDS_MORE_INPUT:
        if (upstream_eof) {
          return twh_err_basic(TEK_WH_ERRC_truncated);
        }
        break;
      case BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT:
        break;
      case BROTLI_DECODER_RESULT_ERROR:
        return twh_err_codec(
            TEK_WH_ERRC_brotli, TEK_WH_COMP_brotli,
            static_cast<int>(BrotliDecoderGetErrorCode(state.get())));
      }
    }
    num_read = size - avail_out;
    return twh_err_ok();
  }
};

/// Brotli compressing sink.
class brotli_sink final : public sink {
  sink &downstream;
  std::unique_ptr<BrotliEncoderState, decltype(&BrotliEncoderDestroyInstance)>
      state{BrotliEncoderCreateInstance(nullptr, nullptr, nullptr),
            BrotliEncoderDestroyInstance};

  /// Run the encoder on specified input and write all produced output.
  tek_wh_err process(BrotliEncoderOperation op, const std::uint8_t *next_in,
                     std::size_t avail_in) {
    std::size_t avail_out = 0;
    for (;;) {
      if (!BrotliEncoderCompressStream(state.get(), op, &avail_in, &next_in,
                                       &avail_out, nullptr, nullptr)) {
        return twh_err_codec(TEK_WH_ERRC_brotli, TEK_WH_COMP_brotli, 0);
      }
      while (BrotliEncoderHasMoreOutput(state.get())) {
        std::size_t out_size = 0;
        const auto out = BrotliEncoderTakeOutput(state.get(), &out_size);
        if (const auto res = downstream.write(out, out_size);
            !tek_wh_err_success(&res)) {
          return res;
        }
      }
      if (op == BROTLI_OPERATION_FINISH
              ? BrotliEncoderIsFinished(state.get())
              : !avail_in) {
        return twh_err_ok();
      }
    }
  }

public:
  brotli_sink(sink &downstream, int quality) : downstream{downstream} {
    if (state) {
      BrotliEncoderSetParameter(
          state.get(), BROTLI_PARAM_QUALITY,
          std::clamp(quality, BROTLI_MIN_QUALITY, BROTLI_MAX_QUALITY));
    }
  }

  constexpr bool valid() const noexcept { return state != nullptr; }

  tek_wh_err write(const void *_Nonnull buf, std::size_t size) override {
    return process(BROTLI_OPERATION_PROCESS,
                   reinterpret_cast<const std::uint8_t *>(buf), size);
  }
  tek_wh_err finish() override {
    return process(BROTLI_OPERATION_FINISH, nullptr, 0);
  }
};

#endif // def TEK_WHB_BROTLI

#ifdef TEK_WHB_GZIP

//===--- GZip -------------------------------------------------------------===//

/// GZip decompressing source.
class gzip_source final : public input_buffered_source {
  twhi_z_stream zs{};
  /// Value indicating whether the stream has been initialized.
  bool initialized{};
  /// Value indicating whether the end of current gzip member has been
  ///    decoded.
  bool member_end{};

public:
  gzip_source(source &upstream) : input_buffered_source{upstream} {
    initialized = twhi_z_inflateInit2(&zs, TWHI_Z_GZIP_WBITS) == Z_OK;
  }
  ~gzip_source() override {
    if (initialized) {
      twhi_z_inflateEnd(&zs);
    }
  }

  constexpr bool valid() const noexcept { return initialized; }

  tek_wh_err read(void *_Nonnull buf, std::size_t size,
                  std::size_t &num_read) override {
    zs.next_out = reinterpret_cast<unsigned char *>(buf);
    zs.avail_out = static_cast<unsigned>(size);
    while (zs.avail_out) {
      if (!zs.avail_in && !upstream_eof) {
        std::size_t n;
        if (const auto res = refill(n); !tek_wh_err_success(&res)) {
          return res;
        }
        zs.next_in = in_buf.get();
        zs.avail_in = static_cast<unsigned>(n);
      }
      if (member_end) {
        if (!zs.avail_in) {
          break;
        }
        // Concatenated gzip member
        twhi_z_inflateReset(&zs);
        member_end = false;
      }
      if (!zs.avail_in && upstream_eof && !got_input) {
        // Empty body
        break;
      }
      const auto res = twhi_z_inflate(&zs, Z_NO_FLUSH);
      if (res == Z_STREAM_END) {
        member_end = true;
        continue;
      }
      if (res == Z_BUF_ERROR) {
        if (!zs.avail_in && upstream_eof) {
          return twh_err_basic(TEK_WH_ERRC_truncated);
        }
        continue;
      }
      if (res != Z_OK) {
        return twh_err_codec(TEK_WH_ERRC_gzip, TEK_WH_COMP_gzip, res);
      }
    }
    num_read = size - zs.avail_out;
    return twh_err_ok();
  }
};

/// GZip compressing sink.
class gzip_sink final : public sink {
  sink &downstream;
  twhi_z_stream zs{};
  std::unique_ptr<unsigned char[]> out_buf{new unsigned char[chunk_size]};
  bool initialized{};

  /// Run deflate on current input and write all produced output.
  tek_wh_err process(int flush) {
    for (;;) {
      zs.next_out = out_buf.get();
      zs.avail_out = chunk_size;
      const auto res = twhi_z_deflate(&zs, flush);
      if (res != Z_OK && res != Z_STREAM_END && res != Z_BUF_ERROR) {
        return twh_err_codec(TEK_WH_ERRC_gzip, TEK_WH_COMP_gzip, res);
      }
      if (const auto out_size = chunk_size - zs.avail_out; out_size) {
        if (const auto wres = downstream.write(out_buf.get(), out_size);
            !tek_wh_err_success(&wres)) {
          return wres;
        }
      }
      if (flush == Z_FINISH ? res == Z_STREAM_END
                            : !zs.avail_in && zs.avail_out) {
        return twh_err_ok();
      }
    }
  }

public:
  gzip_sink(sink &downstream, int quality) : downstream{downstream} {
    initialized =
        twhi_z_deflateInit2(&zs, std::clamp(quality, 1, 9), Z_DEFLATED,
                            TWHI_Z_GZIP_WBITS, 8, Z_DEFAULT_STRATEGY) == Z_OK;
  }
  ~gzip_sink() override {
    if (initialized) {
      twhi_z_deflateEnd(&zs);
    }
  }

  constexpr bool valid() const noexcept { return initialized; }

  tek_wh_err write(const void *_Nonnull buf, std::size_t size) override {
    zs.next_in = const_cast<unsigned char *>(
        static_cast<const unsigned char *>(buf));
    zs.avail_in = static_cast<unsigned>(size);
    return process(Z_NO_FLUSH);
  }
  tek_wh_err finish() override { return process(Z_FINISH); }
};

#endif // def TEK_WHB_GZIP

#ifdef TEK_WHB_ZSTD

//===--- Zstandard --------------------------------------------------------===//

/// Zstandard decompressing source.
class zstd_source final : public input_buffered_source {
  std::unique_ptr<ZSTD_DCtx, decltype(&ZSTD_freeDCtx)> ctx{ZSTD_createDCtx(),
                                                           ZSTD_freeDCtx};
  ZSTD_inBuffer in{.src = nullptr, .size = 0, .pos = 0};
  /// Value indicating whether the last decoded frame has been completed.
  bool frame_done{true};

public:
  zstd_source(source &upstream) : input_buffered_source{upstream} {}

  constexpr bool valid() const noexcept { return ctx != nullptr; }

  tek_wh_err read(void *_Nonnull buf, std::size_t size,
                  std::size_t &num_read) override {
    ZSTD_outBuffer out{.dst = buf, .size = size, .pos = 0};
    while (out.pos < out.size) {
      if (in.pos == in.size && !upstream_eof) {
        std::size_t n;
        if (const auto res = refill(n); !tek_wh_err_success(&res)) {
          return res;
        }
        in = {.src = in_buf.get(), .size = n, .pos = 0};
      }
      const bool input_exhausted = in.pos == in.size && upstream_eof;
      if (input_exhausted && frame_done) {
        break;
      }
      const auto prev_in_pos = in.pos;
      const auto prev_out_pos = out.pos;
      const auto ret = ZSTD_decompressStream(ctx.get(), &out, &in);
      if (ZSTD_isError(ret)) {
        return twh_err_codec(TEK_WH_ERRC_zstd, TEK_WH_COMP_zstd,
                             static_cast<int>(ZSTD_getErrorCode(ret)));
      }
      frame_done = ret == 0;
      if (input_exhausted && !frame_done && in.pos == prev_in_pos &&
          out.pos == prev_out_pos) {
        return twh_err_basic(TEK_WH_ERRC_truncated);
      }
    }
    num_read = out.pos;
    return twh_err_ok();
  }
};

/// Zstandard compressing sink.
class zstd_sink final : public sink {
  sink &downstream;
  std::unique_ptr<ZSTD_CCtx, decltype(&ZSTD_freeCCtx)> ctx{ZSTD_createCCtx(),
                                                           ZSTD_freeCCtx};
  std::unique_ptr<unsigned char[]> out_buf{new unsigned char[chunk_size]};

  /// Run the compressor on specified input and write all produced output.
  tek_wh_err process(ZSTD_EndDirective directive, ZSTD_inBuffer &in) {
    for (;;) {
      ZSTD_outBuffer out{.dst = out_buf.get(), .size = chunk_size, .pos = 0};
      const auto ret = ZSTD_compressStream2(ctx.get(), &out, &in, directive);
      if (ZSTD_isError(ret)) {
        return twh_err_codec(TEK_WH_ERRC_zstd, TEK_WH_COMP_zstd,
                             static_cast<int>(ZSTD_getErrorCode(ret)));
      }
      if (out.pos) {
        if (const auto res = downstream.write(out_buf.get(), out.pos);
            !tek_wh_err_success(&res)) {
          return res;
        }
      }
      if (directive == ZSTD_e_end ? ret == 0 : in.pos == in.size) {
        return twh_err_ok();
      }
    }
  }

public:
  zstd_sink(sink &downstream, int quality) : downstream{downstream} {
    if (ctx) {
      ZSTD_CCtx_setParameter(
          ctx.get(), ZSTD_c_compressionLevel,
          std::clamp(quality, ZSTD_minCLevel(), ZSTD_maxCLevel()));
    }
  }

  constexpr bool valid() const noexcept { return ctx != nullptr; }

  tek_wh_err write(const void *_Nonnull buf, std::size_t size) override {
    ZSTD_inBuffer in{.src = buf, .size = size, .pos = 0};
    return process(ZSTD_e_continue, in);
  }
  tek_wh_err finish() override {
    ZSTD_inBuffer in{.src = nullptr, .size = 0, .pos = 0};
    return process(ZSTD_e_end, in);
  }
};

#endif // def TEK_WHB_ZSTD

//===-- Private functions -------------------------------------------------===//

/// Create a transform instance and check that its library context has been
///    created successfully.
///
/// @tparam T
///    Type of the transform to create.
/// @tparam B
///    Interface type of the transform.
/// @param [out] out
///    Variable that receives the created transform.
/// @param args
///    Arguments to pass to the transform's constructor.
/// @return A @ref tek_wh_err indicating the result of operation.
template <typename T, typename B, typename... Args>
static tek_wh_err make_checked(std::unique_ptr<B> &out, Args &&...args) {
  auto transform = std::make_unique<T>(std::forward<Args>(args)...);
  if (!transform->valid()) {
    return twh_err_basic(TEK_WH_ERRC_comp_init);
  }
  out = std::move(transform);
  return twh_err_ok();
}

} // namespace

//===-- Public functions --------------------------------------------------===//

tek_wh_err make_decompressor(int comp, source &upstream,
                             std::unique_ptr<source> &out) {
  switch (comp) {
  case TEK_WH_COMP_none:
    out = std::make_unique<passthrough_source>(upstream);
    return twh_err_ok();
  case TEK_WH_COMP_brotli:
#ifdef TEK_WHB_BROTLI
    return make_checked<brotli_source>(out, upstream);
#else  // def TEK_WHB_BROTLI
    return twh_err_basic(TEK_WH_ERRC_unsupported_comp);
#endif // def TEK_WHB_BROTLI else
  case TEK_WH_COMP_gzip:
#ifdef TEK_WHB_GZIP
    return make_checked<gzip_source>(out, upstream);
#else  // def TEK_WHB_GZIP
    return twh_err_basic(TEK_WH_ERRC_unsupported_comp);
#endif // def TEK_WHB_GZIP else
  case TEK_WH_COMP_zstd:
#ifdef TEK_WHB_ZSTD
    return make_checked<zstd_source>(out, upstream);
#else  // def TEK_WHB_ZSTD
    return twh_err_basic(TEK_WH_ERRC_unsupported_comp);
#endif // def TEK_WHB_ZSTD else
  default:
    return twh_err_basic(TEK_WH_ERRC_unknown_comp);
  }
}

tek_wh_err make_compressor(const tek_wh_comp_settings &settings,
                           sink &downstream, std::unique_ptr<sink> &out) {
  switch (settings.algorithm) {
  case TEK_WH_COMP_none:
    out = std::make_unique<passthrough_sink>(downstream);
    return twh_err_ok();
  case TEK_WH_COMP_brotli:
#ifdef TEK_WHB_BROTLI
    return make_checked<brotli_sink>(out, downstream, settings.quality);
#else  // def TEK_WHB_BROTLI
    return twh_err_basic(TEK_WH_ERRC_unsupported_comp);
#endif // def TEK_WHB_BROTLI else
  case TEK_WH_COMP_gzip:
#ifdef TEK_WHB_GZIP
    return make_checked<gzip_sink>(out, downstream, settings.quality);
#else  // def TEK_WHB_GZIP
    return twh_err_basic(TEK_WH_ERRC_unsupported_comp);
#endif // def TEK_WHB_GZIP else
  case TEK_WH_COMP_zstd:
#ifdef TEK_WHB_ZSTD
    return make_checked<zstd_sink>(out, downstream, settings.quality);
#else  // def TEK_WHB_ZSTD
    return twh_err_basic(TEK_WH_ERRC_unsupported_comp);
#endif // def TEK_WHB_ZSTD else
  default:
    return twh_err_basic(TEK_WH_ERRC_unknown_comp);
  }
}

const char *codec_err_msg(tek_wh_comp comp, int code) noexcept {
  switch (comp) {
#ifdef TEK_WHB_BROTLI
  case TEK_WH_COMP_brotli:
    return code == 0 ? "Brotli encoder failure"
                     : BrotliDecoderErrorString(
                           static_cast<BrotliDecoderErrorCode>(code));
#endif // def TEK_WHB_BROTLI
#ifdef TEK_WHB_GZIP
  case TEK_WH_COMP_gzip:
    return twhi_z_zError(code);
#endif // def TEK_WHB_GZIP
#ifdef TEK_WHB_ZSTD
  case TEK_WH_COMP_zstd:
    return ZSTD_getErrorString(static_cast<ZSTD_ErrorCode>(code));
#endif // def TEK_WHB_ZSTD
  default:
    return nullptr;
  }
}

} // namespace tek::wharf
