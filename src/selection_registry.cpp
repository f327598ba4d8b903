#include "selection_registry.hpp"

#include <algorithm>
#include <sstream>

namespace eddy {

selection_id_t selection_registry::add(
        const interval pieces, const bool is_priority, std::function<void()> on_ready)
{
    const auto id = next_id_++;
    // priority selections are placed after the last priority selection, normal ones at
    // the end, so that the registration order is preserved within each group
    auto pos = selections_.end();
    if(is_priority) {
        pos = std::find_if(selections_.begin(), selections_.end(),
                [](const selection& s) { return !s.is_priority; });
    }
    selections_.insert(pos, selection{id, pieces, is_priority, std::move(on_ready)});
    return id;
}

bool selection_registry::remove(const selection_id_t id)
{
    auto it = std::find_if(selections_.begin(), selections_.end(),
            [id](const selection& s) { return s.id == id; });
    if(it == selections_.end()) {
        return false;
    }
    selections_.erase(it);
    return true;
}

int selection_registry::remove_standing(const interval pieces)
{
    const auto end = std::remove_if(selections_.begin(), selections_.end(),
            [&pieces](const selection& s) {
                return !s.is_streaming() && (s.pieces == pieces);
            });
    const int num_removed = selections_.end() - end;
    selections_.erase(end, selections_.end());
    return num_removed;
}

bool selection_registry::remove_latest_streaming(const interval pieces)
{
    // ids are handed out in increasing order, so the latest one is the one with the
    // highest id, regardless of where its priority placed it
    auto latest = selections_.end();
    for(auto it = selections_.begin(); it != selections_.end(); ++it) {
        if(it->is_streaming() && (it->pieces == pieces)
                && ((latest == selections_.end()) || (it->id > latest->id))) {
            latest = it;
        }
    }
    if(latest == selections_.end()) {
        return false;
    }
    selections_.erase(latest);
    return true;
}

bool selection_registry::contains(const selection_id_t id) const noexcept
{
    return std::any_of(selections_.begin(), selections_.end(),
            [id](const selection& s) { return s.id == id; });
}

piece_priority selection_registry::priority(const piece_index_t piece) const noexcept
{
    auto result = piece_priority::none;
    for(const auto& s : selections_) {
        if(s.pieces.contains(piece)) {
            if(s.is_priority) {
                return piece_priority::high;
            }
            result = piece_priority::normal;
        }
    }
    return result;
}

int selection_registry::num_selections(const piece_index_t piece) const noexcept
{
    return std::count_if(selections_.begin(), selections_.end(),
            [piece](const selection& s) { return s.pieces.contains(piece); });
}

std::vector<std::function<void()>> selection_registry::ready_handlers(
        const piece_index_t piece) const
{
    std::vector<std::function<void()>> handlers;
    for(const auto& s : selections_) {
        if(s.is_streaming() && s.pieces.contains(piece)) {
            handlers.push_back(s.on_ready);
        }
    }
    return handlers;
}

std::string selection_registry::to_string() const
{
    std::stringstream ss;
    for(const auto& s : selections_) {
        ss << '#' << s.id << "[" << s.pieces.begin << ", " << s.pieces.end << ")"
           << (s.is_priority ? " high" : " normal")
           << (s.is_streaming() ? " streaming" : "") << '\n';
    }
    return ss.str();
}

} // namespace eddy
