#include "capital_pool.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <algorithm>

namespace risk {

    namespace {
        // Absorbs floating point residue when a reservation is returned in parts
        constexpr double kCashEpsilon = 1e-9;
    }

    CapitalPool::CapitalPool(double initial_cash)
        : initial_cash_(initial_cash), cash_(initial_cash), reserved_(0.0)
    {
        if (initial_cash < 0.0) {
            throw core::BacktestException(fmt::format("Initial cash cannot be negative (got {}).", initial_cash));
        }
    }

    bool CapitalPool::reserve(double amount) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (amount < 0.0 || amount > cash_ + kCashEpsilon) {
            return false;
        }
        cash_ = std::max(0.0, cash_ - amount);
        reserved_ += amount;
        return true;
    }

    void CapitalPool::release(double amount) {
        std::lock_guard<std::mutex> lock(mutex_);
        const double returned = std::min(amount, reserved_);
        reserved_ -= returned;
        cash_ += returned;
    }

    bool CapitalPool::settle(double reserved_amount, double cash_delta) {
        std::lock_guard<std::mutex> lock(mutex_);
        const double returned = std::min(reserved_amount, reserved_);
        const double new_cash = cash_ + returned + cash_delta;
        if (new_cash < -kCashEpsilon) {
            core::logging::getLogger()->warn("Settlement of {:.2f} refused: cash would drop to {:.2f}", cash_delta, new_cash);
            return false;
        }
        reserved_ -= returned;
        cash_ = std::max(0.0, new_cash);
        return true;
    }

    void CapitalPool::settleClose(double cash_delta) {
        std::lock_guard<std::mutex> lock(mutex_);
        cash_ += cash_delta;
        if (cash_ < -kCashEpsilon) {
            core::logging::getLogger()->error("Closing trade left a cash deficit of {:.2f}; new entries are blocked", -cash_);
        } else if (cash_ < 0.0) {
            cash_ = 0.0;
        }
    }

    double CapitalPool::cash() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cash_;
    }

    double CapitalPool::reserved() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return reserved_;
    }

} // namespace risk
