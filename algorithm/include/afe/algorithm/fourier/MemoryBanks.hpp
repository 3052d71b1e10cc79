#ifndef AFE_ALGORITHM_MEMORY_BANKS_HPP
#define AFE_ALGORITHM_MEMORY_BANKS_HPP

#include <array>
#include <cstddef>
#include <span>

#include <afe/algorithm/fourier/Addressing.hpp>
#include <afe/algorithm/fourier/FixedPoint.hpp>

namespace afe::algorithm::fft {

/**
 * @brief arena of two N-sample banks used as ping-pong buffers.
 *
 * The read/write roles are not stored but follow from the stage parity (see `readBank()`/`writeBank()`),
 * so advancing the stage counter is all it takes to swap them.
 */
template<std::size_t N, std::size_t W = 16UZ>
struct MemoryBanks {
    using sample_type = fixed::Sample<W>;
    using bank_type   = std::array<sample_type, N>;

    static constexpr std::size_t size = N;

    [[nodiscard]] constexpr bank_type&       operator[](Bank bank) noexcept { return _banks[static_cast<std::size_t>(bank)]; }
    [[nodiscard]] constexpr const bank_type& operator[](Bank bank) const noexcept { return _banks[static_cast<std::size_t>(bank)]; }

    [[nodiscard]] constexpr const bank_type& readBankFor(std::size_t stage) const noexcept { return (*this)[readBank(stage)]; }
    [[nodiscard]] constexpr bank_type&       writeBankFor(std::size_t stage) noexcept { return (*this)[writeBank(stage)]; }

    [[nodiscard]] constexpr std::span<const sample_type, N> result() const noexcept { return (*this)[finalBank<N>]; }

    constexpr void clear() noexcept {
        for (auto& bank : _banks) {
            bank.fill(sample_type{});
        }
    }

private:
    std::array<bank_type, 2UZ> _banks{};
};

} // namespace afe::algorithm::fft

#endif // AFE_ALGORITHM_MEMORY_BANKS_HPP
