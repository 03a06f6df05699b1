#include "engine/Verifier.hpp"

#include "engine/ChunkIo.hpp"
#include "util/Logger.hpp"

#include <algorithm>
#include <format>
#include <vector>

Verifier::Verifier(size_t chunk_size, ProgressFn on_progress)
    : chunk_size_(chunk_size), on_progress_(std::move(on_progress)) {}

auto Verifier::read_device(IBlockDevice& device, uint64_t offset, std::span<uint8_t> buffer)
    -> std::expected<void, TransferError> {
    size_t got = 0;
    while (got < buffer.size()) {
        auto n = device.read_at(offset + got, buffer.subspan(got));
        if (!n) {
            return std::unexpected(n.error());
        }
        if (*n == 0) {
            return std::unexpected(TransferError{
                .kind = ErrorKind::READ_ERROR,
                .offset = offset + got,
                .message = std::format("Unexpected end of {} at offset {}", device.path(),
                                       offset + got)});
        }
        got += *n;
    }
    return {};
}

auto Verifier::verify(IByteSource& source, IBlockDevice& device,
                      const std::atomic<bool>& cancel_flag) -> VerifyResult {
    if (auto opened = source.open(); !opened) {
        return VerifyResult{.status = VerifyStatus::IO_ERROR, .error = opened.error()};
    }

    const uint64_t total = source.size();
    const uint64_t padded_total = chunk_io::round_up(total, device.sector_size());

    std::vector<uint8_t> reference(chunk_size_);
    std::vector<uint8_t> readback(chunk_size_);

    LOG_DEBUG("Verifier", std::format("Comparing {} bytes of {} against {}", padded_total,
                                      source.describe(), device.path()));

    uint64_t offset = 0;
    while (offset < padded_total) {
        if (cancel_flag.load()) {
            source.close();
            return VerifyResult{.status = VerifyStatus::CANCELLED,
                                .bytes_verified = std::min(offset, total)};
        }

        const auto length = static_cast<size_t>(std::min<uint64_t>(chunk_size_, padded_total - offset));
        const auto data_length =
            offset < total ? static_cast<size_t>(std::min<uint64_t>(length, total - offset)) : 0;

        auto want = std::span(reference).first(length);
        auto got = std::span(readback).first(length);

        if (auto r = chunk_io::read_exact(source, want.first(data_length), offset); !r) {
            source.close();
            return VerifyResult{.status = VerifyStatus::IO_ERROR,
                                .error = r.error(),
                                .bytes_verified = std::min(offset, total)};
        }
        std::fill(want.begin() + static_cast<std::ptrdiff_t>(data_length), want.end(), 0);

        if (auto r = read_device(device, offset, got); !r) {
            source.close();
            return VerifyResult{.status = VerifyStatus::IO_ERROR,
                                .error = r.error(),
                                .bytes_verified = std::min(offset, total)};
        }

        if (auto [w, g] = std::mismatch(want.begin(), want.end(), got.begin(), got.end()); w != want.end()) {
            const uint64_t at = offset + static_cast<uint64_t>(w - want.begin());
            LOG_WARNING("Verifier",
                        std::format("Mismatch at offset {}: expected 0x{:02x}, read 0x{:02x}", at,
                                    *w, *g));
            source.close();
            return VerifyResult{.status = VerifyStatus::MISMATCH,
                                .offset = at,
                                .bytes_verified = std::min(at, total)};
        }

        offset += length;
        if (on_progress_) {
            on_progress_(std::min(offset, total));
        }
    }

    source.close();
    return VerifyResult{.status = VerifyStatus::MATCH, .bytes_verified = total};
}
