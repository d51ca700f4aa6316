#ifndef CKG_RESULT_HPP
#define CKG_RESULT_HPP

/**
 * @file result.hpp
 * @brief Success-or-error return type.
 *
 * Builds, configuration loading and file reads return a Result so the
 * caller decides whether a failure is fatal:
 * @code
 *     auto summary = engine.build_graph("./src");
 *     if (summary.is_err()) {
 *         std::cerr << summary.error() << "\n";
 *         return 1;
 *     }
 *     std::cout << summary.value().node_count << " nodes\n";
 * @endcode
 */

#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace ckg {

    template<typename T, typename E>
    class Result {
    public:
        static Result success(T value) {
            return Result(std::in_place_index<0>, std::move(value));
        }

        static Result failure(E error) {
            return Result(std::in_place_index<1>, std::move(error));
        }

        [[nodiscard]] bool is_ok() const noexcept {
            return state_.index() == 0;
        }

        [[nodiscard]] bool is_err() const noexcept {
            return state_.index() == 1;
        }

        /**
         * @throws std::logic_error on an error result.
         */
        T& value() {
            require(true);
            return std::get<0>(state_);
        }

        const T& value() const {
            require(true);
            return std::get<0>(state_);
        }

        /**
         * @throws std::logic_error on a success result.
         */
        E& error() {
            require(false);
            return std::get<1>(state_);
        }

        const E& error() const {
            require(false);
            return std::get<1>(state_);
        }

        /**
         * Feeds the value to @p next, which returns a Result with the same
         * error type; an error is forwarded as is.
         */
        template<typename F>
        auto and_then(F&& next) const -> std::invoke_result_t<F, const T&> {
            using Next = std::invoke_result_t<F, const T&>;
            if (is_err()) {
                return Next::failure(std::get<1>(state_));
            }
            return std::forward<F>(next)(std::get<0>(state_));
        }

    private:
        template<std::size_t I, typename V>
        Result(std::in_place_index_t<I> tag, V&& payload) : state_(tag, std::forward<V>(payload)) {}

        void require(const bool ok) const {
            if (ok && is_err()) {
                throw std::logic_error("Result::value() called on an error result");
            }
            if (!ok && is_ok()) {
                throw std::logic_error("Result::error() called on a success result");
            }
        }

        std::variant<T, E> state_;
    };

    template<typename E>
    class Result<void, E> {
    public:
        static Result success() {
            return Result(std::nullopt);
        }

        static Result failure(E error) {
            return Result(std::optional<E>(std::move(error)));
        }

        [[nodiscard]] bool is_ok() const noexcept {
            return !error_.has_value();
        }

        [[nodiscard]] bool is_err() const noexcept {
            return error_.has_value();
        }

        /**
         * @throws std::logic_error on a success result.
         */
        const E& error() const {
            if (!error_) {
                throw std::logic_error("Result::error() called on a success result");
            }
            return *error_;
        }

    private:
        explicit Result(std::optional<E> error) : error_(std::move(error)) {}

        std::optional<E> error_;
    };

}  // namespace ckg

#endif //CKG_RESULT_HPP
