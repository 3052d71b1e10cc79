#ifndef AFE_LIFECYCLE_HPP
#define AFE_LIFECYCLE_HPP

#include <expected>
#include <source_location>
#include <string>

#include <fmt/format.h>

#ifdef __GNUC__
#pragma GCC diagnostic push // ignore warning of external libraries that from this lib-context we do not have any control over
#ifndef __clang__
#pragma GCC diagnostic ignored "-Wuseless-cast"
#endif
#pragma GCC diagnostic ignored "-Wsign-conversion"
#endif
#include <magic_enum.hpp>
#ifdef __GNUC__
#pragma GCC diagnostic pop
#endif

#include <afe/Error.hpp>
#include <afe/meta/utils.hpp>

namespace afe::lifecycle {
/**
 * @enum lifecycle::State enumerates the phases of one FFT batch.
 *
 * - `IDLE`: no batch in flight, waiting for `start`.
 * - `LOAD`: accepting input samples, each stored at its bit-reversed address.
 * - `COMPUTE`: running the butterfly stages over the two memory banks.
 * - `OUTPUT`: streaming the result out in natural order.
 *
 * State diagram:
 *
 *            ┌──────────┐   start()
 *    ┌──────>┤   IDLE   ├────────────┐
 *    │       └────┬─────┘            v
 *    │            ^           ┌──────┴─────┐
 *    │            │ reset()   │    LOAD    │ <- last input address received
 *    │            │ from any  └──────┬─────┘
 *    │            │ state            v
 *    │       ┌────┴─────┐     ┌──────┴─────┐
 *    └───────┤  OUTPUT  ├<────┤  COMPUTE   │ <- last butterfly of the last stage written
 *  last      └──────────┘     └────────────┘
 *  entry
 *
 * `IDLE` can be reached from any state at any time (reset), all other transitions follow the ring.
 */
enum class State : char { IDLE, LOAD, COMPUTE, OUTPUT };
using enum State;

inline constexpr bool isBusy(State state) noexcept { return state != IDLE; }

constexpr bool isValidTransition(const State from, const State to) noexcept {
    if (to == State::IDLE || from == to) {
        return true;
    }
    switch (from) {
    case State::IDLE: return to == State::LOAD;
    case State::LOAD: return to == State::COMPUTE;
    case State::COMPUTE: return to == State::OUTPUT;
    case State::OUTPUT: return false;
    default: return false;
    }
}

/**
 * @brief StateMachine class template that manages the batch phases of the FFT controller (TDerived).
 *
 * If implemented in TDerived, the following hooks are called after the state has been updated:
 * - `enterLoad()`    when transitioning from IDLE to LOAD
 * - `enterCompute()` when transitioning from LOAD to COMPUTE
 * - `enterOutput()`  when transitioning from COMPUTE to OUTPUT
 * - `enterIdle(State previous)` when returning to IDLE from any other state
 *
 * To observe state changes, TDerived can implement `stateChanged(State oldState, State newState)`.
 */
template<typename TDerived>
class StateMachine {
protected:
    State _state = State::IDLE;

    void setAndNotifyState(State oldState, State newState) {
        _state = newState;
        if constexpr (requires(TDerived& d) { d.stateChanged(oldState, newState); }) {
            static_cast<TDerived*>(this)->stateChanged(oldState, newState);
        }
    }

    std::string getName() const {
        if constexpr (requires(const TDerived& d) { d.settings.name; }) {
            return std::string{static_cast<const TDerived*>(this)->settings.name};
        } else {
            return meta::type_name<TDerived>();
        }
    }

public:
    StateMachine() noexcept = default;

    [[nodiscard]] std::expected<void, Error> changeStateTo(State newState, const std::source_location location = std::source_location::current()) {
        const State oldState = _state;
        if (oldState == newState) {
            return {};
        }

        if (!isValidTransition(oldState, newState)) {
            return std::unexpected(Error{fmt::format("'{}' invalid state transition in {} from {} -> to {}", //
                                             getName(), meta::type_name<TDerived>(),                       //
                                             magic_enum::enum_name(oldState), magic_enum::enum_name(newState)),
                location});
        }

        setAndNotifyState(oldState, newState);

        auto& derived = *static_cast<TDerived*>(this);
        if constexpr (requires(TDerived& d) { d.enterLoad(); }) {
            if (newState == State::LOAD) {
                derived.enterLoad();
            }
        }
        if constexpr (requires(TDerived& d) { d.enterCompute(); }) {
            if (newState == State::COMPUTE) {
                derived.enterCompute();
            }
        }
        if constexpr (requires(TDerived& d) { d.enterOutput(); }) {
            if (newState == State::OUTPUT) {
                derived.enterOutput();
            }
        }
        if constexpr (requires(TDerived& d) { d.enterIdle(oldState); }) {
            if (newState == State::IDLE) {
                derived.enterIdle(oldState);
            }
        }
        return {};
    }

    [[nodiscard]] State state() const noexcept { return _state; }
};

} // namespace afe::lifecycle

#endif // AFE_LIFECYCLE_HPP
