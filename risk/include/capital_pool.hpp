#pragma once

#include <mutex>

namespace risk {

    // Cash shared by every symbol. Reservations hold cash for orders in flight.
    // Opening trades can never leave free cash below zero; only closing a short
    // that lost more than the account holds can (see settleClose).
    class CapitalPool {
    public:
        explicit CapitalPool(double initial_cash);

        CapitalPool(const CapitalPool&) = delete;
        CapitalPool& operator=(const CapitalPool&) = delete;

        // Moves `amount` from free cash into the reservation. False if cash is short.
        bool reserve(double amount);

        // Returns a reservation to free cash
        void release(double amount);

        // Drops `reserved_amount` from the reservation back into cash, then applies
        // `cash_delta`. Nothing changes and false is returned if cash would go negative.
        bool settle(double reserved_amount, double cash_delta);

        // Books the proceeds of a closed position. Always applied, even when the
        // result is a cash deficit; reserve() refuses everything until it is covered.
        void settleClose(double cash_delta);

        double cash() const;
        double reserved() const;
        double initialCash() const { return initial_cash_; }

    private:
        const double initial_cash_;
        mutable std::mutex mutex_;
        double cash_;
        double reserved_;
    };

} // namespace risk
