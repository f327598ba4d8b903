#include "file.hpp"
#include "piece_store.hpp"
#include "stream_error.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include <asio/io_context.hpp>
#include <asio/post.hpp>

namespace eddy {

static std::shared_ptr<piece_store> validate_geometry(
        std::shared_ptr<piece_store> store, const file_descriptor& descriptor)
{
    if(store == nullptr) {
        throw std::invalid_argument("file must be attached to a store");
    }
    if(descriptor.offset < 0 || descriptor.length < 0) {
        throw std::invalid_argument(util::format("invalid file geometry: offset %lli, "
                "length %lli", (long long)descriptor.offset, (long long)descriptor.length));
    }
    // without metadata the size of the store is not known yet
    if(store->has_bitfield() && descriptor.offset + descriptor.length > store->size()) {
        throw std::invalid_argument(util::format("file [%lli, %lli) reaches past the "
                "end of the store (%lli)", (long long)descriptor.offset,
                (long long)(descriptor.offset + descriptor.length),
                (long long)store->size()));
    }
    return store;
}

file::file(std::shared_ptr<piece_store> store, file_descriptor descriptor,
        const stream_settings& settings)
    : state_(active{validate_geometry(std::move(store), descriptor)})
    , ios_(std::get<active>(state_).store->get_io_context())
    , name_(std::move(descriptor.name))
    , path_(std::move(descriptor.path))
    , length_(descriptor.length)
    , offset_(descriptor.offset)
    , stream_settings_(settings)
{
    if(length_ == 0) {
        // there is nothing to download, so we're trivially done
        mark_done();
    } else {
        pieces_ = map_to_pieces(
                offset_, length_, std::get<active>(state_).store->piece_length());
    }
}

bool file::is_destroyed() const noexcept
{
    return std::holds_alternative<destroyed>(state_);
}

int64_t file::downloaded() const
{
    const auto* s = std::get_if<active>(&state_);
    if(s == nullptr || length_ == 0 || !s->store->has_bitfield()) {
        return 0;
    }

    const piece_store& store = *s->store;
    const int64_t piece_length = store.piece_length();
    const auto first = pieces_.first;
    const auto last = pieces_.last;

    // The first piece may begin with bytes of the previous file, which don't count.
    // The missing bytes of an unverified piece may be anywhere in the piece, so we
    // can't tell how many of them are in the irrelevant head; assume all of them are
    // ours, but don't go negative.
    const int64_t irrelevant_head = offset_ % piece_length;
    int64_t downloaded = store.has_piece(first)
            ? piece_length - irrelevant_head
            : std::max(piece_length - irrelevant_head - store.missing_bytes(first),
                      int64_t(0));

    // The last piece is counted in full here (unless it's also the first) and its
    // bytes belonging to the next file are subtracted below, so that a file within a
    // single piece gets both corrections applied to the same piece.
    for(auto piece = first + 1; piece <= last; ++piece) {
        if(store.has_piece(piece)) {
            downloaded += piece_length;
        } else {
            downloaded += piece_length - store.missing_bytes(piece);
        }
    }

    // If the file ends on a piece boundary, no bytes of the last piece are irrelevant.
    const int64_t irrelevant_tail
            = (piece_length - (offset_ + length_) % piece_length) % piece_length;
    downloaded -= irrelevant_tail;

    // The store updates missing counts independently of this computation, so the
    // result may be briefly off.
    return std::min(std::max(downloaded, int64_t(0)), length_);
}

double file::progress() const
{
    if(length_ == 0) {
        return 0.0;
    }
    return double(downloaded()) / double(length_);
}

void file::select(const bool priority)
{
    if(length_ == 0) {
        return;
    }
    auto* s = std::get_if<active>(&state_);
    if(s == nullptr) {
        log(log_event::selection, log::priority::high, "can't select destroyed file");
        return;
    }
    log(log_event::selection, "selecting pieces [%i, %i] (%s)", pieces_.first,
            pieces_.last, priority ? "high" : "normal");
    s->store->select(pieces_.first, pieces_.last, priority);
}

void file::deselect()
{
    if(length_ == 0) {
        return;
    }
    auto* s = std::get_if<active>(&state_);
    if(s == nullptr) {
        log(log_event::selection, log::priority::high, "can't deselect destroyed file");
        return;
    }
    log(log_event::selection, "deselecting pieces [%i, %i]", pieces_.first,
            pieces_.last);
    s->store->deselect(pieces_.first, pieces_.last, false);
}

std::shared_ptr<file_stream> file::create_read_stream(const stream_options& options)
{
    auto* s = std::get_if<active>(&state_);
    if(s == nullptr) {
        log(log_event::stream, log::priority::high, "can't stream destroyed file");
        return file_stream::make_failed(ios_, make_error_code(stream_errc::file_destroyed));
    }
    if(length_ == 0) {
        return file_stream::make_empty(ios_);
    }
    if(s->store->is_destroyed()) {
        log(log_event::stream, log::priority::high, "can't stream from destroyed store");
        return file_stream::make_failed(ios_, make_error_code(stream_errc::store_destroyed));
    }
    if(!file_stream::is_range_valid(options, length_)) {
        log(log_event::stream, log::priority::high, "invalid stream range [%lli, %lli]",
                (long long)options.start, (long long)options.end);
        return file_stream::make_failed(ios_, make_error_code(stream_errc::invalid_range));
    }

    // throws std::bad_weak_ptr if this file is not owned by a shared_ptr, in which case
    // the selection could never be released
    std::weak_ptr<file> self = shared_from_this();

    auto stream = std::make_shared<file_stream>(
            ios_, s->store, name_, offset_, length_, options, stream_settings_);
    const piece_range pieces = stream->pieces();
    const auto id = s->store->select(pieces.first, pieces.last, true,
            [weak_stream = std::weak_ptr<file_stream>(stream)] {
                if(auto stream = weak_stream.lock()) {
                    stream->notify();
                }
            });
    log(log_event::stream, "stream#%i selected pieces [%i, %i] as #%lli", stream->id(),
            pieces.first, pieces.last, (long long)id);

    // The selection id is the token that is consumed when releasing the selection, so
    // even if the stream invoked this twice, the store would only see one deselect.
    stream->on_end([self = std::move(self), pieces, selection = id](
                           const error_code&) mutable {
        const auto token = std::exchange(selection, invalid_selection_id);
        if(token == invalid_selection_id) {
            return;
        }
        if(auto f = self.lock()) {
            f->release_stream_selection(pieces, token);
        }
    });
    return stream;
}

void file::release_stream_selection(const piece_range& pieces, const selection_id_t id)
{
    auto* s = std::get_if<active>(&state_);
    if(s == nullptr) {
        log(log_event::stream, "file destroyed, not releasing selection #%lli",
                (long long)id);
        return;
    }
    if(s->store->is_destroyed()) {
        log(log_event::stream, "store destroyed, not releasing selection #%lli",
                (long long)id);
        return;
    }
    log(log_event::stream, "releasing selection #%lli [%i, %i]", (long long)id,
            pieces.first, pieces.last);
    s->store->deselect(pieces.first, pieces.last, true, id);
}

void file::async_wait_done(std::function<void()> handler)
{
    if(is_done_) {
        asio::post(ios_, std::move(handler));
        return;
    }
    done_handlers_.emplace_back(std::move(handler));
}

void file::update_done()
{
    if(is_done_) {
        return;
    }
    const auto* s = std::get_if<active>(&state_);
    if(s == nullptr || !s->store->has_bitfield()) {
        return;
    }
    for(auto piece = pieces_.first; piece <= pieces_.last; ++piece) {
        if(!s->store->has_piece(piece)) {
            return;
        }
    }
    mark_done();
}

void file::mark_done()
{
    is_done_ = true;
    log(log_event::progress, "file done");
    auto handlers = std::move(done_handlers_);
    done_handlers_.clear();
    for(auto& handler : handlers) {
        asio::post(ios_, std::move(handler));
    }
}

void file::destroy()
{
    if(is_destroyed()) {
        return;
    }
    log(log_event::lifecycle, "destroying file");
    // dropping the active state releases our reference to the store
    state_ = destroyed{};
}

template <typename... Args>
void file::log(const log_event event, const char* format, Args&&... args) const
{
    log(event, log::priority::normal, format, std::forward<Args>(args)...);
}

template <typename... Args>
void file::log(const log_event event, const log::priority priority, const char* format,
        Args&&... args) const
{
#ifdef EDDY_ENABLE_LOGGING
    const auto header = [event]() -> std::string {
        switch(event) {
        case log_event::selection: return "SELECTION";
        case log_event::stream: return "STREAM";
        case log_event::progress: return "PROGRESS";
        case log_event::lifecycle: return "LIFECYCLE";
        default: return "";
        }
    }();
    log::log_file(name_, header, util::format(format, std::forward<Args>(args)...),
            priority);
#endif // EDDY_ENABLE_LOGGING
}

} // namespace eddy
