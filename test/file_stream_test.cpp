#include "eddy/file.hpp"
#include "eddy/file_stream.hpp"
#include "eddy/memory_store.hpp"
#include "eddy/stream_error.hpp"
#include "mock_store.hpp"

#include <catch2/catch.hpp>

#include <asio/error.hpp>
#include <asio/io_context.hpp>

#include <algorithm>
#include <numeric>
#include <set>

using namespace eddy;

namespace {

file_descriptor make_descriptor(std::string name, const int64_t offset, const int64_t length)
{
    file_descriptor d;
    d.path = name;
    d.name = std::move(name);
    d.offset = offset;
    d.length = length;
    return d;
}

struct read_result
{
    std::vector<uint8_t> data;
    std::vector<int> chunks;
    error_code error;
    bool is_done = false;
};

/** Keeps reading until the stream reports an error (which includes eof). */
void read_to_end(const std::shared_ptr<file_stream>& stream, read_result& result)
{
    stream->async_read_some(
            [stream, &result](const error_code& error, std::vector<uint8_t> data) {
                if(error) {
                    result.error = error;
                    result.is_done = true;
                    return;
                }
                result.chunks.push_back(int(data.size()));
                result.data.insert(result.data.end(), data.begin(), data.end());
                read_to_end(stream, result);
            });
}

} // namespace

TEST_CASE("stream a whole file", "[file_stream]")
{
    asio::io_context ios;
    auto store = std::make_shared<mock_store>(ios, 100, 250);
    auto f = std::make_shared<file>(store, make_descriptor("f", 0, 250));

    auto stream = f->create_read_stream();
    REQUIRE(stream->first_piece() == 0);
    REQUIRE(stream->last_piece() == 2);
    REQUIRE(stream->bytes_left() == 250);

    REQUIRE(store->selects.size() == 1);
    REQUIRE(store->selects[0].first == 0);
    REQUIRE(store->selects[0].last == 2);
    REQUIRE(store->selects[0].priority);
    REQUIRE(store->selects[0].has_ready_handler);

    int num_ends = 0;
    error_code end_error;
    stream->on_end([&](const error_code& e) {
        ++num_ends;
        end_error = e;
    });

    store->verify(0);
    store->verify(1);
    store->verify(2);

    read_result result;
    read_to_end(stream, result);
    ios.run();

    REQUIRE(result.is_done);
    REQUIRE(result.error == asio::error::eof);
    REQUIRE(result.chunks == std::vector<int>{100, 100, 50});
    REQUIRE(result.data.size() == 250);
    REQUIRE(result.data[0] == 0);
    REQUIRE(result.data[150] == 1);
    REQUIRE(result.data[249] == 2);

    REQUIRE(stream->state() == stream_state::finished);
    REQUIRE(num_ends == 1);
    REQUIRE(!end_error);

    REQUIRE(store->deselects.size() == 1);
    REQUIRE(store->deselects[0].is_streaming);
    REQUIRE(store->deselects[0].id == store->selects[0].id);
    REQUIRE(store->deselects[0].first == 0);
    REQUIRE(store->deselects[0].last == 2);

    SECTION("reads after the end complete with eof")
    {
        error_code error;
        stream->async_read_some(
                [&error](const error_code& e, std::vector<uint8_t>) { error = e; });
        ios.restart();
        ios.run();
        REQUIRE(error == asio::error::eof);
        REQUIRE(store->deselects.size() == 1);
    }
}

TEST_CASE("reads wait for their piece to be verified", "[file_stream]")
{
    asio::io_context ios;
    auto store = std::make_shared<mock_store>(ios, 100, 300);
    auto f = std::make_shared<file>(store, make_descriptor("f", 0, 300));
    auto stream = f->create_read_stream();

    read_result result;
    read_to_end(stream, result);
    ios.run();
    REQUIRE(result.chunks.empty());
    REQUIRE(!stream->is_ended());

    // a later piece doesn't help the parked read
    store->verify(1);
    ios.restart();
    ios.run();
    REQUIRE(result.chunks.empty());

    store->verify(0);
    ios.restart();
    ios.run();
    REQUIRE(result.chunks == std::vector<int>{100, 100});
    REQUIRE(!result.is_done);

    store->verify(2);
    ios.restart();
    ios.run();
    REQUIRE(result.chunks == std::vector<int>{100, 100, 100});
    REQUIRE(result.error == asio::error::eof);
    REQUIRE(store->num_streaming_deselects() == 1);
}

TEST_CASE("stream a part of a file", "[file_stream]")
{
    asio::io_context ios;
    auto store = std::make_shared<mock_store>(ios, 100, 400);
    store->verify(0);
    store->verify(1);
    store->verify(2);
    store->verify(3);

    stream_options options;
    options.start = 30;
    options.end = 159;

    SECTION("reads stop at piece boundaries")
    {
        auto f = std::make_shared<file>(store, make_descriptor("f", 50, 300));
        auto stream = f->create_read_stream(options);
        // absolute range [80, 210)
        REQUIRE(stream->first_piece() == 0);
        REQUIRE(stream->last_piece() == 2);
        REQUIRE(store->selects[0].first == 0);
        REQUIRE(store->selects[0].last == 2);

        read_result result;
        read_to_end(stream, result);
        ios.run();
        REQUIRE(result.chunks == std::vector<int>{20, 100, 10});
        REQUIRE(result.error == asio::error::eof);
    }

    SECTION("reads are capped by the maximum read size")
    {
        stream_settings settings;
        settings.max_read_size = 25;
        auto f = std::make_shared<file>(store, make_descriptor("f", 0, 300), settings);
        auto stream = f->create_read_stream(options);
        REQUIRE(stream->first_piece() == 0);
        REQUIRE(stream->last_piece() == 1);

        read_result result;
        read_to_end(stream, result);
        ios.run();
        REQUIRE(result.chunks == std::vector<int>{25, 25, 20, 25, 25, 10});
    }

    SECTION("the end is clamped to the end of the file")
    {
        options.end = 1000;
        auto f = std::make_shared<file>(store, make_descriptor("f", 0, 300));
        auto stream = f->create_read_stream(options);
        REQUIRE(stream->bytes_left() == 270);
    }
}

TEST_CASE("streamed bytes come from the file's range of the store", "[file_stream]")
{
    asio::io_context ios;
    std::vector<uint8_t> payload(250);
    std::iota(payload.begin(), payload.end(), uint8_t(0));

    store_info info;
    info.size = 250;
    info.piece_length = 100;
    auto store = std::make_shared<memory_store>(ios, info);
    error_code error;
    for(int piece = 0; piece < 3; ++piece) {
        const int length = store->piece_length(piece);
        store->write_block(block_info(piece, 0, length),
                std::vector<uint8_t>(payload.begin() + piece * 100,
                        payload.begin() + piece * 100 + length),
                error);
        REQUIRE(!error);
    }

    auto f = std::make_shared<file>(store, make_descriptor("f", 150, 100));
    auto stream = f->create_read_stream();
    read_result result;
    read_to_end(stream, result);
    ios.run();

    REQUIRE(result.error == asio::error::eof);
    REQUIRE(result.data == std::vector<uint8_t>(payload.begin() + 150, payload.end()));
    REQUIRE(store->selections().empty());
}

TEST_CASE("invalid stream ranges", "[file_stream]")
{
    asio::io_context ios;
    auto store = std::make_shared<mock_store>(ios, 100, 300);
    auto f = std::make_shared<file>(store, make_descriptor("f", 0, 300));

    stream_options options;
    SECTION("start past the end of the file") { options.start = 300; }
    SECTION("negative start") { options.start = -1; }
    SECTION("start past end")
    {
        options.start = 10;
        options.end = 5;
    }

    auto stream = f->create_read_stream(options);
    error_code end_error;
    stream->on_end([&end_error](const error_code& e) { end_error = e; });
    error_code read_error;
    ios.run();
    stream->async_read_some(
            [&read_error](const error_code& e, std::vector<uint8_t>) { read_error = e; });
    ios.restart();
    ios.run();

    REQUIRE(stream->state() == stream_state::failed);
    REQUIRE(end_error == stream_errc::invalid_range);
    REQUIRE(read_error == stream_errc::invalid_range);
    REQUIRE(store->selects.empty());
    REQUIRE(store->deselects.empty());
}

TEST_CASE("streams of empty files end asynchronously", "[file_stream]")
{
    asio::io_context ios;
    auto store = std::make_shared<mock_store>(ios, 100, 300);
    auto f = std::make_shared<file>(store, make_descriptor("f", 300, 0));

    auto stream = f->create_read_stream();
    REQUIRE(!stream->is_ended());

    int num_ends = 0;
    stream->on_end([&](const error_code& e) {
        REQUIRE(!e);
        ++num_ends;
    });
    ios.run();
    REQUIRE(stream->state() == stream_state::finished);
    REQUIRE(num_ends == 1);

    // late observers are notified too
    stream->on_end([&](const error_code& e) {
        REQUIRE(!e);
        ++num_ends;
    });
    ios.restart();
    ios.run();
    REQUIRE(num_ends == 2);
    REQUIRE(store->selects.empty());
}

TEST_CASE("closing streams", "[file_stream]")
{
    asio::io_context ios;
    auto store = std::make_shared<mock_store>(ios, 100, 300);
    auto f = std::make_shared<file>(store, make_descriptor("f", 0, 300));
    auto stream = f->create_read_stream();

    error_code end_error;
    int num_ends = 0;
    stream->on_end([&](const error_code& e) {
        ++num_ends;
        end_error = e;
    });

    read_result result;
    read_to_end(stream, result);
    ios.run();
    REQUIRE(!result.is_done);

    stream->close();
    stream->close();
    ios.restart();
    ios.run();

    REQUIRE(result.is_done);
    REQUIRE(result.error == stream_errc::stream_closed);
    REQUIRE(stream->state() == stream_state::closed);
    REQUIRE(num_ends == 1);
    REQUIRE(end_error == stream_errc::stream_closed);
    REQUIRE(store->num_streaming_deselects() == 1);

    SECTION("verifying a piece afterwards doesn't revive the stream")
    {
        store->verify(0);
        ios.restart();
        ios.run();
        REQUIRE(result.chunks.empty());
        REQUIRE(store->num_streaming_deselects() == 1);
    }
}

TEST_CASE("only one read may be outstanding", "[file_stream]")
{
    asio::io_context ios;
    auto store = std::make_shared<mock_store>(ios, 100, 300);
    auto f = std::make_shared<file>(store, make_descriptor("f", 0, 300));
    auto stream = f->create_read_stream();

    read_result first;
    read_to_end(stream, first);
    error_code second_error;
    stream->async_read_some(
            [&second_error](const error_code& e, std::vector<uint8_t>) { second_error = e; });
    ios.run();
    REQUIRE(second_error == stream_errc::read_in_progress);
    REQUIRE(!first.is_done);

    // the first read is unaffected
    store->verify(0);
    ios.restart();
    ios.run();
    REQUIRE(first.chunks == std::vector<int>{100});
    stream->close();
    ios.restart();
    ios.run();
}

TEST_CASE("each stream releases its own selection exactly once", "[file_stream]")
{
    asio::io_context ios;

    SECTION("regardless of the order in which the streams end")
    {
        auto store = std::make_shared<mock_store>(ios, 100, 300);
        auto f = std::make_shared<file>(store, make_descriptor("f", 0, 300));
        std::vector<std::shared_ptr<file_stream>> streams;
        for(int i = 0; i < 4; ++i) {
            streams.push_back(f->create_read_stream());
        }
        REQUIRE(store->selects.size() == 4);

        streams[2]->close();
        streams[0]->close();
        ios.run();
        REQUIRE(store->num_streaming_deselects() == 2);
        REQUIRE(store->deselects[0].id == store->selects[2].id);
        REQUIRE(store->deselects[1].id == store->selects[0].id);

        // the others finish reading
        store->verify(0);
        store->verify(1);
        store->verify(2);
        read_result r3;
        read_result r1;
        read_to_end(streams[3], r3);
        read_to_end(streams[1], r1);
        ios.restart();
        ios.run();
        REQUIRE(r3.error == asio::error::eof);
        REQUIRE(r1.error == asio::error::eof);

        REQUIRE(store->num_streaming_deselects() == 4);
        std::set<selection_id_t> ids;
        for(const auto& d : store->deselects) {
            ids.insert(d.id);
        }
        REQUIRE(ids == std::set<selection_id_t>{0, 1, 2, 3});
    }

    SECTION("and the store's priorities are restored")
    {
        store_info info;
        info.size = 300;
        info.piece_length = 100;
        auto store = std::make_shared<memory_store>(ios, info);
        auto f = std::make_shared<file>(store, make_descriptor("f", 0, 300));
        f->select();

        auto a = f->create_read_stream();
        auto b = f->create_read_stream();
        REQUIRE(store->priority(1) == piece_priority::high);

        a->close();
        ios.run();
        REQUIRE(store->priority(1) == piece_priority::high);

        b->close();
        ios.restart();
        ios.run();
        REQUIRE(store->priority(1) == piece_priority::normal);

        f->deselect();
        REQUIRE(store->priority(1) == piece_priority::none);
        REQUIRE(store->selections().empty());
    }
}

TEST_CASE("selections are not released after teardown", "[file_stream]")
{
    asio::io_context ios;
    auto store = std::make_shared<mock_store>(ios, 100, 300);
    auto f = std::make_shared<file>(store, make_descriptor("f", 0, 300));
    auto stream = f->create_read_stream();
    int num_ends = 0;
    stream->on_end([&num_ends](const error_code&) { ++num_ends; });

    SECTION("destroyed file") { f->destroy(); }
    SECTION("file no longer exists") { f.reset(); }
    SECTION("destroyed store") { store->destroyed = true; }

    stream->close();
    ios.run();
    REQUIRE(num_ends == 1);
    REQUIRE(store->deselects.empty());
}

TEST_CASE("reading from a destroyed store fails the stream", "[file_stream]")
{
    asio::io_context ios;
    auto store = std::make_shared<mock_store>(ios, 100, 300);
    auto f = std::make_shared<file>(store, make_descriptor("f", 0, 300));
    auto stream = f->create_read_stream();

    store->destroyed = true;
    read_result result;
    read_to_end(stream, result);
    ios.run();

    REQUIRE(result.error == stream_errc::store_destroyed);
    REQUIRE(stream->state() == stream_state::failed);
    REQUIRE(store->deselects.empty());
}

TEST_CASE("a failed store read fails the stream", "[file_stream]")
{
    asio::io_context ios;
    auto store = std::make_shared<mock_store>(ios, 100, 300);
    auto f = std::make_shared<file>(store, make_descriptor("f", 0, 300));
    auto stream = f->create_read_stream();

    store->verify(0);
    read_result result;
    read_to_end(stream, result);
    // the piece is lost before the read reaches the store
    store->verified.reset(0);
    ios.run();

    REQUIRE(result.error == store_errc::piece_not_available);
    REQUIRE(stream->state() == stream_state::failed);
    REQUIRE(store->num_streaming_deselects() == 1);
}

TEST_CASE("dropped streams release their selection", "[file_stream]")
{
    asio::io_context ios;
    store_info info;
    info.size = 300;
    info.piece_length = 100;
    auto store = std::make_shared<memory_store>(ios, info);
    auto f = std::make_shared<file>(store, make_descriptor("f", 0, 300));

    error_code read_error;
    int num_read = 0;
    auto on_read = [&](const error_code& e, std::vector<uint8_t> data) {
        read_error = e;
        num_read += int(data.size());
    };

    SECTION("without reading")
    {
        auto stream = f->create_read_stream();
        REQUIRE(store->priority(1) == piece_priority::high);
    }

    SECTION("after reading some")
    {
        error_code error;
        store->write_block(block_info(0, 0, 100), std::vector<uint8_t>(100, 1), error);
        REQUIRE(!error);
        auto stream = f->create_read_stream();
        stream->async_read_some(on_read);
        ios.run();
        REQUIRE(num_read == 100);
        REQUIRE(!stream->is_ended());
    }

    SECTION("with a read waiting for data")
    {
        {
            auto stream = f->create_read_stream();
            stream->async_read_some(on_read);
            ios.run();
        }
        ios.restart();
        ios.run();
        REQUIRE(read_error == stream_errc::stream_closed);
    }

    ios.restart();
    ios.run();
    REQUIRE(store->selections().empty());
    REQUIRE(store->priority(1) == piece_priority::none);
}

TEST_CASE("a dropped stream is released only once", "[file_stream]")
{
    asio::io_context ios;
    auto store = std::make_shared<mock_store>(ios, 100, 300);
    auto f = std::make_shared<file>(store, make_descriptor("f", 0, 300));

    auto a = f->create_read_stream();
    auto b = f->create_read_stream();
    a->close();
    a.reset();
    b.reset();
    ios.run();

    REQUIRE(store->num_streaming_deselects() == 2);
    REQUIRE(store->deselects[0].id == store->selects[0].id);
    REQUIRE(store->deselects[1].id == store->selects[1].id);
}

TEST_CASE("a stream ends with its last byte", "[file_stream]")
{
    asio::io_context ios;
    auto store = std::make_shared<mock_store>(ios, 100, 100);
    auto f = std::make_shared<file>(store, make_descriptor("f", 0, 100));
    store->verify(0);

    auto stream = f->create_read_stream();
    int num_ends = 0;
    stream->on_end([&num_ends](const error_code& e) {
        REQUIRE(!e);
        ++num_ends;
    });

    int num_read = 0;
    stream->async_read_some([&num_read](const error_code& e, std::vector<uint8_t> data) {
        REQUIRE(!e);
        num_read += int(data.size());
    });
    ios.run();

    REQUIRE(num_read == 100);
    REQUIRE(stream->is_ended());
    REQUIRE(stream->state() == stream_state::finished);
    REQUIRE(num_ends == 1);
    REQUIRE(store->num_streaming_deselects() == 1);

    error_code error;
    stream->async_read_some([&error](const error_code& e, std::vector<uint8_t>) { error = e; });
    stream.reset();
    ios.restart();
    ios.run();
    REQUIRE(error == asio::error::eof);
    REQUIRE(num_ends == 1);
    REQUIRE(store->num_streaming_deselects() == 1);
}
