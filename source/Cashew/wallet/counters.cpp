#include <Cashew/wallet/counters.hpp>
#include <Cashew/errors.hpp>

namespace Cashew {

    operation_counters::operator JSON () const {
        JSON::object_t x {};
        x["keysetId"] = KeysetID;
        x["start"] = Start;
        x["count"] = Count;
        x["next"] = Next;
        return x;
    }

    std::ostream &operator << (std::ostream &o, const operation_counters &c) {
        return o << "counters {" << c.KeysetID << ", start " << c.Start << ", count " << c.Count << ", next " << c.Next << "}";
    }

    JSON write (const counter_snapshot &s) {
        JSON::object_t x {};
        for (const auto &[k, n] : s) x[k] = n;
        return x;
    }

    counter_snapshot read_counter_snapshot (const JSON &j) {
        if (j == nullptr) return {};
        if (!j.is_object ()) throw data::exception {} << "invalid counter snapshot format";

        counter_snapshot s {};
        for (const auto &[k, n] : j.items ()) {
            if (!n.is_number_integer ()) throw data::exception {} << "invalid counter for keyset " << k;
            int64 next = int64 (n);
            if (next < 0) throw invalid_configuration {"negative counter for keyset " + k};
            s[k] = next;
        }

        return s;
    }

    void counter_source::advance_to_at_least (const keyset_id &, int64) {
        throw counter_capability_unsupported {"advance_to_at_least"};
    }

    void counter_source::set_next (const keyset_id &, int64) {
        throw counter_capability_unsupported {"set_next"};
    }

    counter_snapshot counter_source::snapshot () const {
        throw counter_capability_unsupported {"snapshot"};
    }

    ephemeral_counter_source::ephemeral_counter_source (const counter_snapshot &initial) {
        for (const auto &[k, n] : initial) {
            if (n < 0) throw invalid_configuration {"negative counter for keyset " + k};
            get (k).Next = n;
        }
    }

    ephemeral_counter_source::cursor &ephemeral_counter_source::get (const keyset_id &k) {
        std::lock_guard<std::mutex> lock (Mutex);
        auto c = Cursors.find (k);
        if (c == Cursors.end ()) c = Cursors.emplace (k, std::make_unique<cursor> ()).first;
        return *c->second;
    }

    ephemeral_counter_source::cursor *ephemeral_counter_source::find (const keyset_id &k) const {
        std::lock_guard<std::mutex> lock (Mutex);
        auto c = Cursors.find (k);
        return c == Cursors.end () ? nullptr : c->second.get ();
    }

    uint64 ephemeral_counter_source::queued (const keyset_id &k) const {
        cursor *c = find (k);
        if (c == nullptr) return 0;
        return c->Tickets - c->Serving;
    }

    counter_range ephemeral_counter_source::reserve (const keyset_id &k, int64 n) {
        if (n < 0) throw invalid_configuration {"cannot reserve a negative number of counters"};

        // a peek at a keyset we have never seen does not create it.
        if (n == 0 && find (k) == nullptr) return counter_range {0, 0};

        return with_next (k, [n] (int64 &next) -> counter_range {
            counter_range r {next, n};
            next += n;
            return r;
        });
    }

    void ephemeral_counter_source::advance_to_at_least (const keyset_id &k, int64 min_next) {
        if (min_next <= 0 && find (k) == nullptr) return;

        with_next (k, [min_next] (int64 &next) {
            if (min_next > next) next = min_next;
        });
    }

    void ephemeral_counter_source::set_next (const keyset_id &k, int64 n) {
        if (n < 0) throw invalid_configuration {"counter cannot be negative"};

        with_next (k, [n] (int64 &next) {
            next = n;
        });
    }

    counter_snapshot ephemeral_counter_source::snapshot () const {
        std::lock_guard<std::mutex> lock (Mutex);
        counter_snapshot s {};
        for (const auto &[k, c] : Cursors) {
            std::lock_guard<std::mutex> cursor_lock (c->Mutex);
            s[k] = c->Next;
        }
        return s;
    }
}
