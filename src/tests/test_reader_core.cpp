#include "reader_core.hpp"
#include <cassert>
#include <iostream>
#include <memory>

using namespace httpfile;

// Minimal handle for driving the state machine directly.
struct CountingHandle {
    bool tracks = false;
    std::uint64_t pos = 0;
    bool tracks_position() const { return tracks; }
    std::uint64_t position() const { return pos; }
};

static ResponseHead response(int status, Headers headers, std::string url = "http://example.com/data.bin") {
    ResponseHead head;
    head.status_code = status;
    head.headers = std::move(headers);
    head.url = std::move(url);
    return head;
}

static StreamInfo info(std::uint64_t length, bool seekable, bool chunked = false, std::uint64_t start = 0) {
    StreamInfo s;
    s.length = length;
    s.seekable = seekable;
    s.chunked = chunked;
    s.start = start;
    return s;
}

void test_seek_threshold_boundary() {
    assert(choose_seek(0, 0, 500) == SeekAction::None);
    assert(choose_seek(0, 300, 500) == SeekAction::Discard);
    assert(choose_seek(400, 900, 500) == SeekAction::Discard);
    assert(choose_seek(400, 901, 500) == SeekAction::Reconnect);
    assert(choose_seek(400, 399, 500) == SeekAction::Reconnect);
    assert(choose_seek(10, 11, 0) == SeekAction::Reconnect);
    std::cout << "✓ seek threshold is inclusive\n";
}

void test_headers() {
    Headers caller{{"X-Token", "abc"}, {"accept-encoding", "gzip"}};
    auto base = base_headers(caller);
    assert(base.at("Accept-Encoding") == "identity");
    assert(base.size() == 2);

    auto h = request_headers(base, {}, std::nullopt);
    assert(!h.contains("Range"));
    h = request_headers(base, {}, 100);
    assert(h.at("range") == "bytes=100-");
    h = request_headers(base, {}, -100);
    assert(h.at("Range") == "bytes=-100");
    h = request_headers(base, {}, 0);
    assert(h.at("Range") == "bytes=0-");

    h = request_headers(base, {{"X-Token", "signed"}, {"Accept-Encoding", "br"}}, std::nullopt);
    assert(h.at("x-token") == "signed");
    assert(h.at("Accept-Encoding") == "identity");
    std::cout << "✓ request headers\n";
}

void test_whence() {
    assert(whence_from_int(0).value() == Whence::Set);
    assert(whence_from_int(1).value() == Whence::Current);
    assert(whence_from_int(2).value() == Whence::End);
    auto bad = whence_from_int(3);
    assert(!bad && bad.error().error == FileError::InvalidConfig);
    std::cout << "✓ whence mapping\n";
}

void test_describe() {
    auto full = describe(response(200, {{"Content-Length", "1000"}, {"Accept-Ranges", "bytes"}}), 0);
    assert(full.length == 1000 && full.seekable && !full.chunked && full.start == 0);
    assert(full.name == "data.bin");

    auto plain = describe(response(200, {{"Content-Length", "1000"}}), 0);
    assert(!plain.seekable);

    auto suffix = describe(response(206, {{"Content-Range", "bytes 900-999/1000"}, {"Content-Length", "100"}}), -100);
    assert(suffix.length == 1000 && suffix.seekable && suffix.start == 900);

    auto ignored = describe(response(200, {{"Content-Length", "1000"}, {"Accept-Ranges", "bytes"}}), 300);
    assert(ignored.start == 0 && !ignored.seekable && ignored.length == 1000);

    auto chunked = describe(response(200, {{"Transfer-Encoding", "chunked"}}), 0);
    assert(chunked.chunked && chunked.length == 0 && !chunked.seekable);

    auto unknown_total = describe(response(206, {{"Content-Range", "bytes 0-99/*"}, {"Content-Length", "100"}}), 0);
    assert(unknown_total.length == 100 && unknown_total.seekable);

    auto named = describe(response(200, {{"Content-Disposition", "attachment; filename=\"report.csv\""}}), 0);
    assert(named.name == "report.csv");
    auto encoded = describe(response(200, {{"Content-Disposition", "attachment; filename*=UTF-8''na%C3%AFve%20file.txt"}}), 0);
    assert(encoded.name == "na\xC3\xAFve file.txt");
    auto from_url = describe(response(200, {}, "https://host/a/b/my%20file.tar?sig=1"), 0);
    assert(from_url.name == "my file.tar");
    std::cout << "✓ stream description from response head\n";
}

void test_plan_seek() {
    ReaderCore<CountingHandle> core(base_headers({}), 500);
    core.establish(std::make_shared<CountingHandle>(), info(1000, true));

    auto plan = core.plan_seek(300, Whence::Set);
    assert(plan && plan->action == SeekAction::Discard && plan->distance == 300);

    core.advance(400);
    plan = core.plan_seek(900, Whence::Set);
    assert(plan->action == SeekAction::Discard && plan->distance == 500);
    plan = core.plan_seek(901, Whence::Set);
    assert(plan->action == SeekAction::Reconnect && plan->target == 901);
    plan = core.plan_seek(0, Whence::Current);
    assert(plan->action == SeekAction::None && plan->target == 400);
    plan = core.plan_seek(-10, Whence::End);
    assert(plan->action == SeekAction::Reconnect && plan->target == 990);
    plan = core.plan_seek(-500, Whence::End);
    assert(plan->action == SeekAction::Discard && plan->distance == 100);
    plan = core.plan_seek(-401, Whence::Current);
    assert(!plan && plan.error().error == FileError::InvalidConfig);

    // Past the end there is nothing to discard.
    ReaderCore<CountingHandle> near_end(base_headers({}), 500);
    near_end.establish(std::make_shared<CountingHandle>(), info(1000, true, false, 900));
    plan = near_end.plan_seek(1100, Whence::Set);
    assert(plan->action == SeekAction::Reconnect);

    ReaderCore<CountingHandle> fixed(base_headers({}), 500);
    fixed.establish(std::make_shared<CountingHandle>(), info(1000, false));
    plan = fixed.plan_seek(0, Whence::Current);
    assert(!plan && plan.error().error == FileError::Unsupported);
    plan = fixed.plan_seek(-5, Whence::Set);
    assert(!plan && plan.error().error == FileError::Unsupported);
    std::cout << "✓ seek planning\n";
}

void test_plan_reconnect() {
    ReaderCore<CountingHandle> core(base_headers({}), 500);
    core.establish(std::make_shared<CountingHandle>(), info(1000, true));
    core.advance(250);

    auto plan = core.plan_reconnect(std::nullopt);
    assert(plan->start == 250 && !plan->detach);
    plan = core.plan_reconnect(-100);
    assert(plan->start == 900 && !plan->detach);
    plan = core.plan_reconnect(-5000);
    assert(plan->start == 0);
    plan = core.plan_reconnect(1000);
    assert(plan->start == 1000 && plan->detach);

    ReaderCore<CountingHandle> chunked(base_headers({}), 500);
    chunked.establish(std::make_shared<CountingHandle>(), info(0, true, true));
    plan = chunked.plan_reconnect(50);
    assert(plan->start == 50 && !plan->detach);

    ReaderCore<CountingHandle> fixed(base_headers({}), 500);
    fixed.establish(std::make_shared<CountingHandle>(), info(1000, false));
    assert(fixed.plan_reconnect(0)->start == 0);
    assert(fixed.plan_reconnect(std::nullopt));
    fixed.advance(10);
    assert(fixed.plan_reconnect(std::nullopt).error().error == FileError::Unsupported);
    assert(fixed.plan_reconnect(5).error().error == FileError::Unsupported);
    assert(fixed.plan_reconnect(0));
    std::cout << "✓ reconnect planning\n";
}

void test_position_accounting() {
    ReaderCore<CountingHandle> core(base_headers({}), 500);
    auto handle = std::make_shared<CountingHandle>();
    handle->tracks = true;
    core.establish(handle, info(1000, true, false, 200));
    assert(core.tell() == 200);

    // A tracking handle is the only source of truth; advance() must not double count.
    handle->pos = 50;
    core.advance(50);
    assert(core.tell() == 250);

    auto old = core.detach(1000);
    assert(old == handle && !core.handle());
    assert(core.tell() == 1000 && core.at_eof());

    auto fresh = std::make_shared<CountingHandle>();
    assert(core.attach(fresh, 300));
    assert(core.tell() == 300 && core.reconnects() == 1);
    core.advance(20);
    assert(core.tell() == 320);
    std::cout << "✓ position accounting\n";
}

void test_length_mismatch_breaks() {
    ReaderCore<CountingHandle> core(base_headers({}), 500);
    core.establish(std::make_shared<CountingHandle>(), info(1000, true));
    assert(core.verify_length(response(206, {{"Content-Range", "bytes 10-999/1000"}})));

    auto bad = core.verify_length(response(206, {{"Content-Range", "bytes 10-1199/1200"}}));
    assert(!bad && bad.error().error == FileError::Protocol);
    assert(core.info().length == 1000);
    auto state = core.check_open();
    assert(!state && state.error().error == FileError::Protocol);
    std::cout << "✓ length mismatch is permanent\n";
}

void test_range_must_match_start() {
    ReaderCore<CountingHandle> core(base_headers({}), 500);
    core.establish(std::make_shared<CountingHandle>(), info(1000, true));

    assert(core.verify_range(response(206, {{"Content-Range", "bytes 300-999/1000"}}), 300));
    assert(core.verify_range(response(200, {{"Content-Length", "1000"}}), 0));

    auto whole = core.verify_range(response(200, {{"Content-Length", "1000"}, {"Accept-Ranges", "bytes"}}), 300);
    assert(!whole && whole.error().error == FileError::Transport);
    assert(whole.error().status_code == 200);
    auto shifted = core.verify_range(response(206, {{"Content-Range", "bytes 200-999/1000"}}), 300);
    assert(!shifted && shifted.error().error == FileError::Transport);

    // Unlike a size change this is not permanent.
    assert(core.check_open());
    std::cout << "✓ reconnect response must start at the requested byte\n";
}

void test_close() {
    ReaderCore<CountingHandle> core(base_headers({}), 500);
    auto handle = std::make_shared<CountingHandle>();
    handle->tracks = true;
    core.establish(handle, info(1000, true));
    handle->pos = 42;

    auto [first, taken] = core.close();
    assert(first && taken == handle);
    assert(core.closed() && core.tell() == 42);
    auto [again, none] = core.close();
    assert(!again && !none);

    assert(core.check_open().error().error == FileError::Closed);
    assert(core.settle().error().error == FileError::Closed);
    assert(core.plan_seek(0, Whence::Set).error().error == FileError::Closed);
    assert(!core.attach(std::make_shared<CountingHandle>(), 0));
    std::cout << "✓ close is terminal and idempotent\n";
}

int main() {
    test_seek_threshold_boundary();
    test_headers();
    test_whence();
    test_describe();
    test_plan_seek();
    test_plan_reconnect();
    test_position_accounting();
    test_length_mismatch_breaks();
    test_range_must_match_start();
    test_close();
    std::cout << "All reader core tests passed\n";
    return 0;
}
