/* This file is part of Tessera project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/local/connect_pair.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/write.hpp>
#include <tessera/common/test.hpp>
#include <tessera/frame/async-reader.hpp>
#include <tessera/frame/async-writer.hpp>

using namespace tessera;
namespace asio = boost::asio;
using socket_type = asio::local::stream_protocol::socket;

namespace {
    struct socket_pair {
        asio::io_context ioc {};
        socket_type out { ioc };
        socket_type in { ioc };
        std::exception_ptr writer_ex {};
        std::exception_ptr reader_ex {};

        socket_pair()
        {
            asio::local::connect_pair(out, in);
        }

        auto on_writer_done()
        {
            return [this](std::exception_ptr ex) { writer_ex = std::move(ex); };
        }

        auto on_reader_done()
        {
            return [this](std::exception_ptr ex) { reader_ex = std::move(ex); };
        }
    };

    template<typename F>
    frame::error catch_frame_error(const std::exception_ptr &ptr, const F &check)
    {
        const auto ex = catch_error<frame::error>([&] {
            if (ptr)
                std::rethrow_exception(ptr);
        });
        check(ex);
        return ex;
    }

    // starts a read, stops it by cancelling the socket once the sent bytes are consumed,
    // then sends the rest and expects the same reader to complete the frame
    void resume_after_cancel(const std::string_view first_hex, const std::string_view rest_hex, const uint64_t expected)
    {
        socket_pair sp {};
        frame::async_reader r { sp.in };
        const auto first = uint8_vector::from_hex(first_hex);
        asio::write(sp.out, asio::const_buffer { first.data(), first.size() });
        bool first_done = false;
        asio::co_spawn(sp.ioc, [&]() -> asio::awaitable<void> {
            co_await r.read<uint64_t>();
            first_done = true;
        }, sp.on_reader_done());
        sp.ioc.poll();
        expect(!first_done);
        sp.in.cancel();
        sp.ioc.restart();
        sp.ioc.run();
        expect(!first_done);
        catch_frame_error(sp.reader_ex, [](const auto &ex) {
            test_same(frame::error_kind::io, ex.kind());
            const auto cause = catch_error<boost::system::system_error>([&] { std::rethrow_exception(ex.cause()); });
            expect(cause.code() == asio::error::operation_aborted) << cause.code().message();
        });

        const auto rest = uint8_vector::from_hex(rest_hex);
        asio::write(sp.out, asio::const_buffer { rest.data(), rest.size() });
        sp.out.shutdown(socket_type::shutdown_send);
        sp.reader_ex = nullptr;
        std::vector<uint64_t> received {};
        asio::co_spawn(sp.ioc, [&]() -> asio::awaitable<void> {
            while (auto v = co_await r.read<uint64_t>())
                received.emplace_back(*v);
        }, sp.on_reader_done());
        sp.ioc.restart();
        sp.ioc.run();
        expect(!sp.reader_ex);
        test_same(1, received.size());
        if (!received.empty())
            test_same(expected, received[0]);
    }
}

suite frame_async_suite = [] {
    "frame::async"_test = [] {
        "frames cross the socket"_test = [] {
            socket_pair sp {};
            const std::vector<std::string> msgs { "hello", "", std::string(200000, 'x'), "bye" };
            std::vector<std::string> received {};
            std::vector<size_t> written {};
            asio::co_spawn(sp.ioc, [&]() -> asio::awaitable<void> {
                frame::async_writer w { sp.out };
                for (const auto &m: msgs)
                    written.emplace_back(co_await w.write(m));
                sp.out.shutdown(socket_type::shutdown_send);
            }, sp.on_writer_done());
            asio::co_spawn(sp.ioc, [&]() -> asio::awaitable<void> {
                frame::async_reader r { sp.in };
                while (auto m = co_await r.read<std::string>())
                    received.emplace_back(std::move(*m));
            }, sp.on_reader_done());
            sp.ioc.run();
            expect(!sp.writer_ex);
            expect(!sp.reader_ex);
            test_same(msgs.size(), received.size());
            test_same(true, msgs == received);
            test_same(4, written.size());
            if (written.size() == 4) {
                test_same(6, written[0]);
                test_same(1, written[1]);
                test_same(200005, written[2]);
            }
        };
        "a stream ending inside a payload"_test = [] {
            socket_pair sp {};
            const auto bytes = uint8_vector::from_hex("0000000101" "000000031903");
            asio::write(sp.out, asio::const_buffer { bytes.data(), bytes.size() });
            sp.out.shutdown(socket_type::shutdown_send);
            std::vector<uint64_t> received {};
            asio::co_spawn(sp.ioc, [&]() -> asio::awaitable<void> {
                frame::async_reader r { sp.in };
                while (auto v = co_await r.read<uint64_t>())
                    received.emplace_back(*v);
            }, sp.on_reader_done());
            sp.ioc.run();
            test_same(1, received.size());
            catch_frame_error(sp.reader_ex, [](const auto &ex) {
                test_same(frame::error_kind::unexpected_eof, ex.kind());
                test_same(std::string { "the stream ended after 6 of 7 bytes of a frame" }, std::string { ex.what() });
            });
        };
        "a stream ending inside a prefix"_test = [] {
            socket_pair sp {};
            const auto bytes = uint8_vector::from_hex("000000");
            asio::write(sp.out, asio::const_buffer { bytes.data(), bytes.size() });
            sp.out.shutdown(socket_type::shutdown_send);
            asio::co_spawn(sp.ioc, [&]() -> asio::awaitable<void> {
                frame::async_reader r { sp.in };
                co_await r.read<uint64_t>();
            }, sp.on_reader_done());
            sp.ioc.run();
            catch_frame_error(sp.reader_ex, [](const auto &ex) {
                test_same(frame::error_kind::unexpected_eof, ex.kind());
            });
        };
        "oversized frames"_test = [] {
            socket_pair sp {};
            asio::co_spawn(sp.ioc, [&]() -> asio::awaitable<void> {
                frame::async_writer w { sp.out };
                co_await w.write(std::string(64, 'x'));
                sp.out.shutdown(socket_type::shutdown_send);
            }, sp.on_writer_done());
            asio::co_spawn(sp.ioc, [&]() -> asio::awaitable<void> {
                frame::async_reader r { sp.in, 16 };
                co_await r.read<std::string>();
            }, sp.on_reader_done());
            sp.ioc.run();
            expect(!sp.writer_ex);
            catch_frame_error(sp.reader_ex, [](const auto &ex) {
                test_same(frame::error_kind::invalid_len, ex.kind());
            });
        };
        "the writer rejects oversized payloads"_test = [] {
            socket_pair sp {};
            asio::co_spawn(sp.ioc, [&]() -> asio::awaitable<void> {
                frame::async_writer w { sp.out, 8 };
                co_await w.write(std::string(64, 'x'));
            }, sp.on_writer_done());
            sp.ioc.run();
            catch_frame_error(sp.writer_ex, [](const auto &ex) {
                test_same(frame::error_kind::invalid_len, ex.kind());
            });
        };
        "a cancelled read resumes inside the prefix"_test = [] {
            resume_after_cancel("0000", "00031903e8", 1000);
        };
        "a cancelled read resumes inside the payload"_test = [] {
            resume_after_cancel("0000000319", "03e8", 1000);
        };
        "explicit context"_test = [] {
            socket_pair sp {};
            cbor::unit ctx {};
            std::optional<std::vector<std::string>> received {};
            asio::co_spawn(sp.ioc, [&]() -> asio::awaitable<void> {
                frame::async_writer w { sp.out };
                co_await w.write_with(std::vector<std::string> { "a", "b" }, ctx);
                sp.out.shutdown(socket_type::shutdown_send);
            }, sp.on_writer_done());
            asio::co_spawn(sp.ioc, [&]() -> asio::awaitable<void> {
                frame::async_reader r { sp.in };
                received = co_await r.read_with<std::vector<std::string>>(ctx);
            }, sp.on_reader_done());
            sp.ioc.run();
            expect(!sp.writer_ex);
            expect(!sp.reader_ex);
            expect(received.has_value());
            if (received)
                test_same(2, received->size());
        };
    };
};
