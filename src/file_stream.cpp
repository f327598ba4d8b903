#include "file_stream.hpp"
#include "block_info.hpp"
#include "piece_store.hpp"
#include "stream_error.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <atomic>
#include <cassert>

#include <asio/error.hpp>
#include <asio/io_context.hpp>
#include <asio/post.hpp>

namespace eddy {

static int next_stream_id()
{
    static std::atomic<int> id{0};
    return ++id;
}

static int64_t effective_end(const stream_options& options, const int64_t length) noexcept
{
    if((options.end == values::none) || (options.end >= length)) {
        return length - 1;
    }
    return options.end;
}

file_stream::file_stream(asio::io_context& ios, std::shared_ptr<piece_store> store,
        std::string name, const int64_t offset, const int64_t length,
        const stream_options& options, const stream_settings& settings)
    : ios_(ios)
    , store_(std::move(store))
    , name_(std::move(name))
    , position_(offset + options.start)
    , end_(offset + effective_end(options, length) + 1)
    , pieces_(map_to_pieces(position_, end_ - position_, store_->piece_length()))
    , settings_(settings)
    , id_(next_stream_id())
{
    assert(is_range_valid(options, length));
    log(log_event::read, "streaming [%lli, %lli) over pieces [%i, %i]",
            (long long)position_, (long long)end_, pieces_.first, pieces_.last);
}

file_stream::file_stream(asio::io_context& ios) : ios_(ios), id_(next_stream_id()) {}

file_stream::~file_stream()
{
    if(is_ended()) {
        return;
    }
    // a stream dropped before it ended counts as closed; its end handlers don't refer
    // to the stream
    log(log_event::end, "stream dropped with %lli bytes left", (long long)bytes_left());
    const auto error = make_error_code(stream_errc::stream_closed);
    if(pending_read_) {
        deliver(std::move(pending_read_), error, {});
    }
    for(auto& handler : end_handlers_) {
        asio::post(ios_, [handler = std::move(handler), error] { handler(error); });
    }
}

std::shared_ptr<file_stream> file_stream::make_empty(asio::io_context& ios)
{
    std::shared_ptr<file_stream> stream(new file_stream(ios));
    asio::post(ios, [stream] {
        if(!stream->is_ended()) {
            stream->end(stream_state::finished, error_code());
        }
    });
    return stream;
}

std::shared_ptr<file_stream> file_stream::make_failed(
        asio::io_context& ios, const error_code& error)
{
    std::shared_ptr<file_stream> stream(new file_stream(ios));
    asio::post(ios, [stream, error] {
        if(!stream->is_ended()) {
            stream->end(stream_state::failed, error);
        }
    });
    return stream;
}

bool file_stream::is_range_valid(
        const stream_options& options, const int64_t length) noexcept
{
    if((options.start < 0) || (options.start >= length)) {
        return false;
    }
    return options.start <= effective_end(options, length);
}

void file_stream::async_read_some(read_handler handler)
{
    if(pending_read_) {
        deliver(std::move(handler), make_error_code(stream_errc::read_in_progress), {});
        return;
    }
    switch(state_) {
    case stream_state::reading:
        break;
    case stream_state::finished:
        deliver(std::move(handler), asio::error::eof, {});
        return;
    case stream_state::closed:
    case stream_state::failed:
        deliver(std::move(handler), error_, {});
        return;
    }

    if(bytes_left() == 0) {
        deliver(std::move(handler), asio::error::eof, {});
        end(stream_state::finished, error_code());
        return;
    }

    pending_read_ = std::move(handler);
    try_read();
}

void file_stream::on_end(end_handler handler)
{
    if(is_ended()) {
        asio::post(ios_, [handler = std::move(handler), error = error_] { handler(error); });
        return;
    }
    end_handlers_.emplace_back(std::move(handler));
}

void file_stream::notify()
{
    if(pending_read_ && !is_store_read_in_progress_ && !is_ended()) {
        try_read();
    }
}

void file_stream::close()
{
    if(is_ended()) {
        return;
    }
    log(log_event::end, "closing stream with %lli bytes left", (long long)bytes_left());
    const auto error = make_error_code(stream_errc::stream_closed);
    if(pending_read_) {
        deliver(std::move(pending_read_), error, {});
        pending_read_ = nullptr;
    }
    end(stream_state::closed, error);
}

void file_stream::try_read()
{
    assert(store_);
    assert(pending_read_);
    if(store_->is_destroyed()) {
        const auto error = make_error_code(stream_errc::store_destroyed);
        deliver(std::move(pending_read_), error, {});
        pending_read_ = nullptr;
        end(stream_state::failed, error);
        return;
    }

    const int piece_length = store_->piece_length();
    const auto piece = piece_index_t(position_ / piece_length);
    if(!store_->has_bitfield() || !store_->has_piece(piece)) {
        // nothing to do until the store tells us that new data arrived
        log(log_event::wait, "waiting for piece %i", piece);
        return;
    }

    const int offset = int(position_ - int64_t(piece) * piece_length);
    int length = int(std::min(int64_t(piece_length - offset), bytes_left()));
    if(settings_.max_read_size > 0) {
        length = std::min(length, settings_.max_read_size);
    }

    is_store_read_in_progress_ = true;
    store_->async_read(block_info(piece, offset, length),
            [self = shared_from_this()](const error_code& error, std::vector<uint8_t> data) {
                self->on_store_read(error, std::move(data));
            });
}

void file_stream::on_store_read(const error_code& error, std::vector<uint8_t> data)
{
    is_store_read_in_progress_ = false;
    // the stream may have been closed while the read was in flight, in which case the
    // pending handler was already invoked
    if(is_ended() || !pending_read_) {
        return;
    }
    auto handler = std::move(pending_read_);
    pending_read_ = nullptr;
    if(error) {
        log(log_event::read, log::priority::high, "read error: %s",
                error.message().c_str());
        deliver(std::move(handler), error, {});
        end(stream_state::failed, error);
        return;
    }
    position_ += data.size();
    log(log_event::read, log::priority::low, "read %i bytes, %lli left",
            int(data.size()), (long long)bytes_left());
    handler(error, std::move(data));
    // the handler may have already issued the read that ended the stream
    if((bytes_left() == 0) && !is_ended()) {
        end(stream_state::finished, error_code());
    }
}

void file_stream::deliver(
        read_handler handler, const error_code& error, std::vector<uint8_t> data)
{
    asio::post(ios_,
            [handler = std::move(handler), error, data = std::move(data)]() mutable {
                handler(error, std::move(data));
            });
}

void file_stream::end(const stream_state s, const error_code& error)
{
    assert(s != stream_state::reading);
    assert(!is_ended());
    state_ = s;
    error_ = error;
    if(error) {
        log(log_event::end, "stream ended: %s", error.message().c_str());
    } else {
        log(log_event::end, "stream finished");
    }
    // moving out the handlers makes it impossible to invoke any of them twice
    auto handlers = std::move(end_handlers_);
    end_handlers_.clear();
    for(auto& handler : handlers) {
        asio::post(ios_, [handler = std::move(handler), error] { handler(error); });
    }
}

template <typename... Args>
void file_stream::log(const log_event event, const char* format, Args&&... args) const
{
    log(event, log::priority::normal, format, std::forward<Args>(args)...);
}

template <typename... Args>
void file_stream::log(const log_event event, const log::priority priority,
        const char* format, Args&&... args) const
{
#ifdef EDDY_ENABLE_LOGGING
    const auto header = [event]() -> std::string {
        switch(event) {
        case log_event::read: return "READ";
        case log_event::wait: return "WAIT";
        case log_event::end: return "END";
        default: return "";
        }
    }();
    log::log_stream(name_, id_, header, util::format(format, std::forward<Args>(args)...),
            priority);
#endif // EDDY_ENABLE_LOGGING
}

} // namespace eddy
