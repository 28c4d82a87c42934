#include "fsgate/limits.hpp"

#include <string>

namespace fsgate {

SecurityLimits default_limits() {
    return SecurityLimits{};
}

bool DecompressionBudget::account(std::uint64_t compressed_bytes,
                                  std::uint64_t uncompressed_bytes) {
    if (exceeded_) {
        return false;
    }

    compressed_total_ += compressed_bytes;
    uncompressed_total_ += uncompressed_bytes;

    if (uncompressed_total_ > max_absolute_bytes_) {
        exceeded_ = true;
        error_ = "Decompressed size " + std::to_string(uncompressed_total_) +
                 " exceeds maximum allowed " + std::to_string(max_absolute_bytes_);
        return false;
    }

    if (compressed_total_ > 0 && uncompressed_total_ > ratio_grace_bytes_ &&
        uncompressed_total_ > compressed_total_ * max_ratio_) {
        exceeded_ = true;
        error_ = "Compression ratio exceeds maximum of " + std::to_string(max_ratio_) + ":1 (" +
                 std::to_string(uncompressed_total_) + " bytes from " +
                 std::to_string(compressed_total_) + ")";
        return false;
    }

    return true;
}

} // namespace fsgate
