#ifndef CKG_CANCELLATION_HPP
#define CKG_CANCELLATION_HPP

/**
 * @file cancellation.hpp
 * @brief Cooperative cancellation for graph builds.
 *
 * A default-constructed token can never be cancelled. Copies share state,
 * so the caller keeps one copy and hands another to build_graph().
 */

#include <atomic>
#include <memory>

namespace ckg {

    class CancellationToken {
    public:
        CancellationToken() = default;

        /**
         * Creates a token that can be cancelled through cancel().
         */
        [[nodiscard]] static CancellationToken create() {
            CancellationToken token;
            token.flag_ = std::make_shared<std::atomic<bool>>(false);
            return token;
        }

        void cancel() const noexcept {
            if (flag_) {
                flag_->store(true, std::memory_order_relaxed);
            }
        }

        [[nodiscard]] bool is_cancelled() const noexcept {
            return flag_ && flag_->load(std::memory_order_relaxed);
        }

    private:
        std::shared_ptr<std::atomic<bool>> flag_;
    };

}  // namespace ckg

#endif //CKG_CANCELLATION_HPP
