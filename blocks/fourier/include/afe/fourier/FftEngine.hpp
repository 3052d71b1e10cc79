#ifndef AFE_FOURIER_FFT_ENGINE_HPP
#define AFE_FOURIER_FFT_ENGINE_HPP

#include <array>
#include <cstddef>
#include <cstdio>
#include <expected>
#include <optional>
#include <source_location>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include <afe/Error.hpp>
#include <afe/LifeCycle.hpp>
#include <afe/meta/formatter.hpp>
#include <afe/meta/utils.hpp>

#include <afe/algorithm/fourier/Addressing.hpp>
#include <afe/algorithm/fourier/Butterfly.hpp>
#include <afe/algorithm/fourier/FixedPoint.hpp>
#include <afe/algorithm/fourier/MemoryBanks.hpp>
#include <afe/algorithm/fourier/TwiddleTable.hpp>

namespace afe::blocks::fft {

using algorithm::fft::Direction;

/// runtime settings, picked up at the start of every batch
struct Settings {
    std::string name      = "fft";
    Direction   direction = Direction::Forward;
    bool        verbose   = false; ///< log phase transitions to stderr
};

/// one entry of the output port
template<std::size_t W>
struct OutputBeat {
    fixed::Sample<W> value;
    std::size_t      address;
    bool             valid; ///< asserted for every emitted entry
    bool             last;  ///< asserted with address N-1

    constexpr bool operator==(const OutputBeat&) const noexcept = default;
};

/**
 * @brief N-point radix-2 decimation-in-time FFT controller on Q(W-1) fixed-point samples.
 *
 * A batch runs through the phases of `lifecycle::State`:
 *  - LOAD: samples arrive one at a time through `load(real, imag, naturalAddress)` and are stored in bank A
 *    at the bit-reversed address; receiving address N-1 completes the phase. Every address has to be
 *    supplied exactly once; skipped or duplicated addresses are not detected and yield an undefined result.
 *  - COMPUTE: for each of the log2(N) stages and each of the N/2 butterflies, a single `Butterfly` unit is
 *    reused. Every butterfly takes two `step()`s: the first generates the addresses, reads both operands from
 *    the stage's read bank, fetches the twiddle and latches the butterfly result; the second writes it to the
 *    same addresses of the write bank. The banks swap roles with the stage parity, the result therefore ends
 *    in the write bank of the last stage (bank B for N = 512).
 *  - OUTPUT: each `step()` emits one `OutputBeat`, addresses 0..N-1 in natural order. After the last entry the
 *    controller returns to IDLE and `done()` is asserted until the next `step()` or `start()`.
 *
 * The step count of COMPUTE is 2 * log2(N) * N/2 and that of OUTPUT is N, both independent of the data.
 * Every stage halves, so the output is X[k] / N.
 *
 * The engine is not synchronised; drive an instance from one thread.
 */
template<std::size_t N = 512UZ, std::size_t W = 16UZ>
requires(meta::power_of_two<N> && N >= 4UZ)
class Engine : public lifecycle::StateMachine<Engine<N, W>> {
    using Bank      = algorithm::fft::Bank;
    using Butterfly = algorithm::fft::Butterfly<W>;

public:
    using sample_type = fixed::Sample<W>;
    using value_type  = typename sample_type::value_type;
    using output_type = OutputBeat<W>;
    using banks_type  = algorithm::fft::MemoryBanks<N, W>;

    static constexpr std::size_t size              = N;
    static constexpr std::size_t nStages           = meta::log2_v<N>;
    static constexpr std::size_t nButterflies      = N / 2UZ;
    static constexpr std::size_t stepsPerButterfly = 2UZ;
    static constexpr std::size_t computeStepCount  = stepsPerButterfly * nStages * nButterflies;
    static constexpr std::size_t outputStepCount   = N;

    Settings settings;

    Engine() = default;
    explicit Engine(Settings initialSettings) : settings(std::move(initialSettings)) {}

    // control port

    /// begins a new batch and latches `settings.direction` for it; only effective from IDLE, rejected without side-effects while busy
    [[nodiscard]] std::expected<void, Error> start(std::source_location location = std::source_location::current()) {
        if (busy()) {
            return std::unexpected(Error{fmt::format("'{}' start rejected, batch in flight (state: {}, stage: {}, butterfly: {})", //
                                             settings.name, magic_enum::enum_name(this->state()), _stage, _butterflyIndex),
                location});
        }
        _donePulse          = false;
        _twiddles.direction = settings.direction; // before the IDLE -> LOAD notification
        return this->changeStateTo(lifecycle::LOAD, location);
    }

    [[nodiscard]] bool busy() const noexcept { return lifecycle::isBusy(this->state()); }
    [[nodiscard]] bool done() const noexcept { return _donePulse; }

    /// returns to IDLE from any state and discards a batch in flight
    void reset(std::source_location location = std::source_location::current()) {
        _donePulse = false;
        advanceTo(lifecycle::IDLE, location);
    }

    // input port

    [[nodiscard]] std::expected<void, Error> load(value_type real, value_type imag, std::size_t naturalAddress, std::source_location location = std::source_location::current()) {
        if (this->state() != lifecycle::LOAD) {
            return std::unexpected(Error{fmt::format("'{}' sample for address {} rejected outside LOAD (state: {})", settings.name, naturalAddress, magic_enum::enum_name(this->state())), location});
        }
        if (naturalAddress >= N) {
            return std::unexpected(Error{fmt::format("'{}' input address {} out of range [0, {}]", settings.name, naturalAddress, N - 1UZ), location});
        }

        _banks[Bank::A][algorithm::fft::bitReverse<nStages>(naturalAddress)] = sample_type{real, imag};
        ++_loadedSamples;
        if (naturalAddress == N - 1UZ) {
            return this->changeStateTo(lifecycle::COMPUTE, location);
        }
        return {};
    }

    [[nodiscard]] std::expected<void, Error> load(const sample_type& sample, std::size_t naturalAddress, std::source_location location = std::source_location::current()) { return load(sample.real, sample.imag, naturalAddress, location); }

    // compute and output port

    /// advances the controller by one internal step; returns the emitted entry while in OUTPUT
    std::optional<output_type> step() {
        _donePulse = false;
        switch (this->state()) {
        case lifecycle::COMPUTE: computeStep(); return std::nullopt;
        case lifecycle::OUTPUT: return outputStep();
        case lifecycle::IDLE:
        case lifecycle::LOAD:
        default: return std::nullopt;
        }
    }

    /// steps a fully loaded batch to completion and returns all N output entries
    [[nodiscard]] std::expected<std::vector<output_type>, Error> run(std::source_location location = std::source_location::current()) {
        if (this->state() != lifecycle::COMPUTE && this->state() != lifecycle::OUTPUT) {
            return std::unexpected(Error{fmt::format("'{}' run requires a loaded batch (state: {})", settings.name, magic_enum::enum_name(this->state())), location});
        }

        std::vector<output_type> beats;
        beats.reserve(N);
        while (busy()) {
            if (auto beat = step(); beat.has_value()) {
                beats.push_back(*beat);
            }
        }
        return beats;
    }

    /// start, load in natural order and run one complete batch
    [[nodiscard]] std::expected<std::array<sample_type, N>, Error> transform(std::span<const sample_type> input, std::source_location location = std::source_location::current()) {
        if (input.size() != N) {
            return std::unexpected(Error{fmt::format("'{}' transform expects {} samples, got {}", settings.name, N, input.size()), location});
        }
        if (auto started = start(location); !started) {
            return std::unexpected(started.error());
        }
        for (std::size_t address = 0UZ; address < N; ++address) {
            if (auto loaded = load(input[address], address, location); !loaded) {
                reset(location);
                return std::unexpected(loaded.error());
            }
        }

        auto beats = run(location);
        if (!beats) {
            return std::unexpected(beats.error());
        }
        std::array<sample_type, N> result{};
        for (const auto& beat : *beats) {
            result[beat.address] = beat.value;
        }
        return result;
    }

    // observers

    [[nodiscard]] std::size_t       stage() const noexcept { return _stage; }
    [[nodiscard]] std::size_t       butterflyIndex() const noexcept { return _butterflyIndex; }
    [[nodiscard]] std::size_t       computeSteps() const noexcept { return _computeSteps; }
    [[nodiscard]] std::size_t       loadedSamples() const noexcept { return _loadedSamples; }
    [[nodiscard]] std::size_t       completedBatches() const noexcept { return _completedBatches; }
    [[nodiscard]] const banks_type& banks() const noexcept { return _banks; }
    [[nodiscard]] Direction         direction() const noexcept { return _twiddles.direction; }

    // lifecycle hooks, invoked by lifecycle::StateMachine::changeStateTo

    void enterLoad() {
        _stage          = 0UZ;
        _butterflyIndex = 0UZ;
        _computeSteps   = 0UZ;
        _outputAddress  = 0UZ;
        _loadedSamples  = 0UZ;
        _latch.reset();
    }

    void enterIdle(lifecycle::State previous) {
        if (previous == lifecycle::OUTPUT && _outputAddress == N) {
            _donePulse = true;
            ++_completedBatches;
            return;
        }
        _latch.reset(); // aborted batch
        _banks.clear();
        if (settings.verbose) {
            fmt::print(stderr, "[{}] '{}' batch discarded in {} (stage {}, butterfly {})\n", time::getIsoTime(), settings.name, magic_enum::enum_name(previous), _stage, _butterflyIndex);
        }
    }

    void stateChanged(lifecycle::State oldState, lifecycle::State newState) const {
        if (settings.verbose) {
            fmt::print(stderr, "[{}] '{}' {} -> {} ({} FFT, {}-point, Q{})\n", time::getIsoTime(), settings.name, //
                magic_enum::enum_name(oldState), magic_enum::enum_name(newState), magic_enum::enum_name(_twiddles.direction), N, W - 1UZ);
        }
    }

private:
    struct Latch {
        algorithm::fft::ButterflyAddress address;
        typename Butterfly::Result       result;
    };

    banks_type                            _banks{};
    algorithm::fft::TwiddleTable<N, W>    _twiddles{};
    std::optional<Latch>                  _latch{};
    std::size_t                           _stage{0UZ};
    std::size_t                           _butterflyIndex{0UZ};
    std::size_t                           _computeSteps{0UZ};
    std::size_t                           _outputAddress{0UZ};
    std::size_t                           _loadedSamples{0UZ};
    std::size_t                           _completedBatches{0UZ};
    bool                                  _donePulse{false};

    void advanceTo(lifecycle::State newState, std::source_location location) {
        if (auto changed = this->changeStateTo(newState, location); !changed) {
            fmt::print(stderr, "[{}] {}\n", time::getIsoTime(), changed.error());
        }
    }

    void computeStep() {
        ++_computeSteps;
        if (!_latch.has_value()) { // read: address generation, operand fetch, twiddle lookup, butterfly
            const auto  address = algorithm::fft::butterflyAddress<N>(_stage, _butterflyIndex);
            const auto& source  = _banks.readBankFor(_stage);
            _latch              = Latch{address, Butterfly::compute(source[address.a], source[address.b], _twiddles.lookup(_stage, _butterflyIndex))};
            return;
        }

        // write back to the same addresses in the opposite bank
        auto& target              = _banks.writeBankFor(_stage);
        target[_latch->address.a] = _latch->result.a;
        target[_latch->address.b] = _latch->result.b;
        _latch.reset();

        if (++_butterflyIndex < nButterflies) {
            return;
        }
        _butterflyIndex = 0UZ;
        if (++_stage < nStages) {
            return;
        }
        advanceTo(lifecycle::OUTPUT, std::source_location::current());
    }

    output_type outputStep() {
        const auto        result  = _banks.result();
        const std::size_t address = _outputAddress++;
        output_type       beat{result[address], address, true, address == N - 1UZ};
        if (_outputAddress == N) {
            advanceTo(lifecycle::IDLE, std::source_location::current());
        }
        return beat;
    }
};

} // namespace afe::blocks::fft

#endif // AFE_FOURIER_FFT_ENGINE_HPP
