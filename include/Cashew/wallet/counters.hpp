#ifndef CASHEW_WALLET_COUNTERS
#define CASHEW_WALLET_COUNTERS

#include <Cashew/types.hpp>
#include <atomic>
#include <mutex>
#include <condition_variable>

namespace Cashew {

    // counters [Start, Start + Count) may be used to derive secrets.
    struct counter_range {
        int64 Start;
        int64 Count;

        int64 end () const {
            return Start + Count;
        }

        bool operator == (const counter_range &) const = default;
    };

    std::ostream inline &operator << (std::ostream &o, const counter_range &r) {
        return o << "[" << r.Start << ", " << r.end () << ")";
    }

    // reported to the user after an operation reserves counters so
    // that they can be persisted for recovery.
    struct operation_counters {
        keyset_id KeysetID;
        int64 Start;
        int64 Count;
        // the next unused counter.
        int64 Next;

        bool operator == (const operation_counters &) const = default;

        explicit operator JSON () const;
    };

    std::ostream &operator << (std::ostream &, const operation_counters &);

    // next unused counter for each keyset.
    using counter_snapshot = std::map<keyset_id, int64>;

    JSON write (const counter_snapshot &);
    counter_snapshot read_counter_snapshot (const JSON &);

    // Allocates counters for deterministic secrets. Two reservations
    // for the same keyset never overlap.
    struct counter_source {

        // reserve n consecutive counters. Reserving zero returns the
        // next counter without changing anything.
        // throw invalid_configuration if n is negative.
        virtual counter_range reserve (const keyset_id &, int64 n) = 0;

        // make sure that the next counter is at least min_next. Never goes backward.
        virtual void advance_to_at_least (const keyset_id &, int64 min_next);

        // the rest are optional.
        virtual void set_next (const keyset_id &, int64 next);
        virtual counter_snapshot snapshot () const;

        virtual ~counter_source () {}
    };

    // keeps counters in memory. Reservations on the same keyset
    // are served in the order they arrive.
    struct ephemeral_counter_source : counter_source {

        ephemeral_counter_source (const counter_snapshot &initial = {});

        counter_range reserve (const keyset_id &, int64 n) override;
        void advance_to_at_least (const keyset_id &, int64 min_next) override;
        void set_next (const keyset_id &, int64 next) override;
        counter_snapshot snapshot () const override;

        // run f on the next counter of a keyset. Operations on the same
        // keyset take turns in the order that they arrive.
        template <typename fun>
        auto with_next (const keyset_id &, fun f);

        // operations on the keyset that are running or waiting for a turn.
        uint64 queued (const keyset_id &) const;

    private:
        // a ticket lock around the next counter of one keyset.
        struct cursor {
            int64 Next {0};
            std::mutex Mutex;
            std::condition_variable Turn;
            // taken before Mutex so that turns follow arrival order.
            std::atomic<uint64> Tickets {0};
            std::atomic<uint64> Serving {0};
        };

        // guards the map only, not the cursors.
        mutable std::mutex Mutex;
        std::map<keyset_id, std::unique_ptr<cursor>> Cursors;

        cursor &get (const keyset_id &);

        // nullptr if nothing has been done with this keyset.
        cursor *find (const keyset_id &) const;
    };

    template <typename fun>
    auto ephemeral_counter_source::with_next (const keyset_id &k, fun f) {
        cursor &c = get (k);
        uint64 ticket = c.Tickets++;

        std::unique_lock<std::mutex> lock (c.Mutex);
        c.Turn.wait (lock, [&c, ticket] () {
            return c.Serving == ticket;
        });

        // pass the turn on even if f throws.
        struct next_turn {
            cursor &C;
            ~next_turn () {
                C.Serving++;
                C.Turn.notify_all ();
            }
        } turn {c};

        return f (c.Next);
    }

    // counter operations available to the wallet user.
    struct wallet_counters {
        counter_source &Source;

        int64 peek_next (const keyset_id &k) {
            return Source.reserve (k, 0).Start;
        }

        void advance_to_at_least (const keyset_id &k, int64 min_next) {
            Source.advance_to_at_least (k, min_next);
        }

        void set_next (const keyset_id &k, int64 next) {
            Source.set_next (k, next);
        }

        counter_snapshot snapshot () const {
            return Source.snapshot ();
        }
    };
}

#endif
