#ifndef EDDY_SELECTION_REGISTRY_HEADER
#define EDDY_SELECTION_REGISTRY_HEADER

#include "interval.hpp"
#include "types.hpp"

#include <functional>
#include <string>
#include <vector>

namespace eddy {

enum class piece_priority
{
    // No selection covers the piece.
    none,
    normal,
    high
};

/**
 * Keeps track of the pieces that were selected for acquisition and with what priority.
 *
 * Each call to add creates an entry of its own even if an identical one exists, so
 * overlapping selections are effectively reference counted: a piece's priority is the
 * highest of all entries covering it, and releasing one entry never affects another.
 * This is what lets any number of streams over the same pieces come and go without
 * starving each other or a standing selection.
 */
class selection_registry
{
    struct selection
    {
        selection_id_t id;
        interval pieces;
        bool is_priority;
        // Only streams register a readiness handler, so this also tells apart the
        // streaming selections from the standing ones.
        std::function<void()> on_ready;

        bool is_streaming() const noexcept { return on_ready != nullptr; }
    };

    // Ordered by priority (highest first) and within the same priority by the order
    // of registration.
    std::vector<selection> selections_;

    selection_id_t next_id_ = 0;

public:
    selection_id_t add(const interval pieces, const bool is_priority,
            std::function<void()> on_ready = nullptr);

    /** Releases the selection with this id. Returns false if there is no such entry. */
    bool remove(const selection_id_t id);

    /**
     * Releases all the standing selections registered for exactly these pieces and
     * returns how many were removed.
     */
    int remove_standing(const interval pieces);

    /**
     * Releases the most recently added streaming selection registered for exactly these
     * pieces. Returns false if there was none.
     */
    bool remove_latest_streaming(const interval pieces);

    void clear() noexcept { selections_.clear(); }

    int size() const noexcept { return int(selections_.size()); }
    bool empty() const noexcept { return selections_.empty(); }
    bool contains(const selection_id_t id) const noexcept;

    /** Returns the effective priority of the piece across all selections. */
    piece_priority priority(const piece_index_t piece) const noexcept;

    /** Returns the number of selections covering the piece. */
    int num_selections(const piece_index_t piece) const noexcept;

    /** Returns the readiness handlers of all streaming selections covering piece. */
    std::vector<std::function<void()>> ready_handlers(const piece_index_t piece) const;

    /** Used only for debugging. */
    std::string to_string() const;
};

} // namespace eddy

#endif // EDDY_SELECTION_REGISTRY_HEADER
