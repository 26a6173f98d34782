#pragma once

#include <functional>
#include <utility>

#define HACKLET_CONCAT_(a, b) a ## b
#define HACKLET_CONCAT(a, b) HACKLET_CONCAT_(a, b)

// The specified statement runs when the enclosing scope is left.
#define DEFER(fn) hacklet::scope_guard HACKLET_CONCAT(__defer__, __LINE__) = [&] ( ) { fn ; }

/*

Examples:

    DEFER(ftdi_free(context));

    DEFER({
        if (const auto err = session.lock_network(); err) spdlog::warn(*err);
    });

*/

namespace hacklet {
    class scope_guard {
        public:
            template<class callable>
            scope_guard(callable &&fn) : fn_(std::forward<callable>(fn)) {}
            scope_guard(scope_guard &&other) : fn_(std::move(other.fn_)) { other.fn_ = nullptr; }
            ~scope_guard() { if (fn_) fn_(); }
            scope_guard(const scope_guard &) = delete;
            void operator=(const scope_guard &) = delete;
            void dismiss() { fn_ = nullptr; }
        private:
            std::function<void()> fn_;
    };
}
