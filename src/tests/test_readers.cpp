#include "open.hpp"
#include "buffered_reader.hpp"
#include "fake_transport.hpp"
#include <cassert>
#include <iostream>

using namespace httpfile;
using namespace httpfile::testing;

static std::shared_ptr<FakeResource> resource(std::string content) {
    auto res = std::make_shared<FakeResource>();
    res->content = std::move(content);
    return res;
}

static std::unique_ptr<HttpFile> raw_file(const std::shared_ptr<FakeResource>& res, ReaderOptions options = {}) {
    auto file = HttpFile::open(Url("http://fake/doc.txt"), std::move(options), fake_opener(res));
    assert(file);
    return std::move(*file);
}

static std::unique_ptr<Reader> text_file(const std::shared_ptr<FakeResource>& res, TextOptions text = {}) {
    auto reader = wrap(raw_file(res), true, WrapOptions{.text = std::move(text)});
    assert(reader);
    return std::move(*reader);
}

void test_buffered_reads() {
    auto res = resource(binary_fixture(2000));
    BufferedReader reader(raw_file(res), 16);
    assert(reader.buffer_size() == 16);

    assert(reader.read(5).value() == res->content.substr(0, 5));
    assert(reader.tell().value() == 5);
    assert(reader.raw().tell().value() == 16);

    assert(reader.peek(4).value() == res->content.substr(5, 4));
    assert(reader.tell().value() == 5);

    // Large reads skip the buffer.
    auto big = reader.read(100);
    assert(big && *big == res->content.substr(5, 100));
    assert(reader.tell().value() == 105);

    char out[8];
    auto n = reader.read_into(std::span{out, sizeof(out)});
    assert(n && *n == 8 && std::string(out, 8) == res->content.substr(105, 8));
    assert(reader.mode() == "rb");
    std::cout << "✓ buffered reads\n";
}

void test_buffered_seeks() {
    auto res = resource(binary_fixture(2000));
    BufferedReader reader(raw_file(res, ReaderOptions{.seek_threshold = 100}), 64);

    assert(reader.read(10).value() == res->content.substr(0, 10));
    assert(reader.seek(40).value() == 40);
    assert(reader.raw().tell().value() == 64);
    assert(reader.read(4).value() == res->content.substr(40, 4));
    assert(reader.seek(2).value() == 2);
    assert(reader.seek(-1, Whence::Current).value() == 1);
    assert(reader.read(3).value() == res->content.substr(1, 3));
    assert(res->opens == 1);

    assert(reader.seek(1500).value() == 1500);
    assert(res->opens == 2);
    assert(reader.read(20).value() == res->content.substr(1500, 20));

    assert(reader.seek(-10, Whence::End).value() == 1990);
    assert(reader.read(100).value() == res->content.substr(1990));
    assert(reader.read(1).value().empty());

    auto bad = reader.seek(-5000, Whence::Current);
    assert(!bad && bad.error().error == FileError::InvalidConfig);

    reader.close();
    assert(reader.closed());
    assert(reader.read(1).error().error == FileError::Closed);
    assert(reader.seek(0).error().error == FileError::Closed);
    std::cout << "✓ buffered seeks stay inside the block when they can\n";
}

void test_buffered_failed_seek_keeps_position() {
    auto res = resource(binary_fixture(2000));
    BufferedReader reader(raw_file(res, ReaderOptions{.seek_threshold = 100}), 64);

    assert(reader.read(1).value() == res->content.substr(0, 1));
    auto bad = reader.seek(-5, Whence::Current);
    assert(!bad && bad.error().error == FileError::InvalidConfig);
    assert(reader.tell().value() == 1);
    assert(reader.read(1).value() == res->content.substr(1, 1));

    auto before_start = reader.seek(-5000, Whence::End);
    assert(!before_start && before_start.error().error == FileError::InvalidConfig);
    assert(reader.tell().value() == 2);
    assert(reader.read(2).value() == res->content.substr(2, 2));

    // A failed reconnect still moves the raw reader, so the block goes with it.
    res->fail_next_open = FileErrorInfo{FileError::Transport, "connection reset", 0};
    auto moved = reader.seek(1500);
    assert(!moved && moved.error().message == "connection reset");
    assert(reader.tell().value() == 1500);
    assert(reader.read(4).value() == res->content.substr(1500, 4));
    assert(res->opens == 3);
    std::cout << "✓ failed buffered seeks keep the position\n";
}

void test_buffered_lines() {
    auto res = resource(text_fixture(100));
    BufferedReader reader(raw_file(res), 10);
    assert(reader.read_line().value() == "line 0\n");
    assert(reader.read_line(4).value() == "line");
    assert(reader.read_line().value() == " 1\n");
    auto rest = reader.read_lines();
    assert(rest && rest->size() == 98);
    assert(rest->back() == "line 99\n");
    std::cout << "✓ buffered line reads\n";
}

void test_buffered_non_seekable() {
    auto res = resource(binary_fixture(100));
    res->honor_ranges = false;
    BufferedReader reader(raw_file(res), 16);
    assert(!reader.seekable());
    assert(reader.read(4));
    auto seek = reader.seek(1);
    assert(!seek && seek.error().error == FileError::Unsupported);
    std::cout << "✓ buffered reader keeps non-seekable streams non-seekable\n";
}

void test_text_utf8() {
    auto res = resource("h\xC3\xA9llo\nw\xC3\xB6rld\n\xE2\x82\xAC\xF0\x9F\x98\x80!");
    auto reader = text_file(res);
    assert(reader->mode() == "r");

    assert(reader->read(3).value() == "h\xC3\xA9l");
    assert(reader->tell().value() == 4);
    assert(reader->read_line().value() == "lo\n");
    assert(reader->read_line(2).value() == "w\xC3\xB6");
    assert(reader->read_line().value() == "rld\n");
    assert(reader->read(2).value() == "\xE2\x82\xAC\xF0\x9F\x98\x80");
    assert(reader->read_all().value() == "!");
    assert(reader->read(1).value().empty());

    char out[4];
    auto into = reader->read_into(std::span{out, sizeof(out)});
    assert(!into && into.error().error == FileError::Unsupported);
    std::cout << "✓ utf-8 text\n";
}

void test_text_errors() {
    auto strict = text_file(resource("ab\xFF" "cd"));
    auto failed = strict->read(10);
    assert(!failed && failed.error().error == FileError::Decode);
    assert(failed.error().message.find("0xff") != std::string::npos);

    auto replaced = text_file(resource("ab\xFF" "cd"), TextOptions{.errors = "replace"});
    assert(replaced->read_all().value() == "ab\xEF\xBF\xBD" "cd");

    auto ignored = text_file(resource("ab\xFF" "cd"), TextOptions{.errors = "ignore"});
    assert(ignored->read_all().value() == "abcd");

    auto surrogate = text_file(resource("x\xED\xA0\x80y"), TextOptions{.errors = "replace"});
    assert(surrogate->read_all().value().starts_with("x\xEF\xBF\xBD"));

    auto truncated = text_file(resource("ab\xC3"));
    auto cut = truncated->read_all();
    assert(!cut && cut.error().error == FileError::Decode);
    assert(cut.error().message.find("unexpected end of data") != std::string::npos);

    auto latin = text_file(resource("caf\xE9"), TextOptions{.encoding = "latin-1"});
    assert(latin->read_all().value() == "caf\xC3\xA9");

    auto ascii = text_file(resource("caf\xE9"), TextOptions{.encoding = "ascii", .errors = "replace"});
    assert(ascii->read_all().value() == "caf\xEF\xBF\xBD");

    auto bad_encoding = TextReader::create(raw_file(resource("")), TextOptions{.encoding = "utf-16"});
    assert(!bad_encoding && bad_encoding.error().error == FileError::InvalidConfig);
    auto bad_errors = TextReader::create(raw_file(resource("")), TextOptions{.errors = "surrogateescape"});
    assert(!bad_errors && bad_errors.error().error == FileError::InvalidConfig);
    auto bad_newline = TextReader::create(raw_file(resource("")), TextOptions{.newline = "\n\n"});
    assert(!bad_newline && bad_newline.error().error == FileError::InvalidConfig);
    std::cout << "✓ text encodings and error handlers\n";
}

static std::vector<std::string> lines_with(std::optional<std::string> newline) {
    auto reader = text_file(resource("a\r\nb\rc\nd"), TextOptions{.newline = std::move(newline)});
    auto lines = reader->read_lines();
    assert(lines);
    return *lines;
}

void test_newline_modes() {
    assert((lines_with(std::nullopt) == std::vector<std::string>{"a\n", "b\n", "c\n", "d"}));
    assert((lines_with("") == std::vector<std::string>{"a\r\n", "b\r", "c\n", "d"}));
    assert((lines_with("\n") == std::vector<std::string>{"a\r\n", "b\rc\n", "d"}));
    assert((lines_with("\r") == std::vector<std::string>{"a\r", "\nb\r", "c\nd"}));
    assert((lines_with("\r\n") == std::vector<std::string>{"a\r\n", "b\rc\nd"}));

    auto translated = text_file(resource("a\r\nb\rc\nd"));
    assert(translated->read_all().value() == "a\nb\nc\nd");
    auto trailing = text_file(resource("x\r"));
    assert(trailing->read_line().value() == "x\n");
    std::cout << "✓ newline modes\n";
}

void test_text_seek() {
    auto res = resource(text_fixture(50));
    auto reader = text_file(res);

    assert(reader->read_line().value() == "line 0\n");
    assert(reader->tell().value() == 7);
    assert(reader->seek(0, Whence::Current).value() == 7);
    assert(reader->seek(14).value() == 14);
    assert(reader->read_line().value() == "line 2\n");
    assert(reader->seek(0).value() == 0);
    assert(reader->read(4).value() == "line");

    auto end = reader->seek(0, Whence::End);
    assert(end && *end == res->content.size());
    assert(reader->read(1).value().empty());

    assert(reader->seek(3, Whence::Current).error().error == FileError::Unsupported);
    assert(reader->seek(-3, Whence::End).error().error == FileError::Unsupported);
    assert(reader->seek(-1).error().error == FileError::InvalidConfig);

    reader->close();
    assert(reader->closed());
    assert(reader->read(1).error().error == FileError::Closed);
    std::cout << "✓ text seeks use byte offsets\n";
}

void test_open_modes() {
    auto res = resource(text_fixture(10));

    auto bad_mode = httpfile::open(Url("http://fake/doc.txt"), "rw", OpenOptions{.opener = fake_opener(res)});
    assert(!bad_mode && bad_mode.error().error == FileError::InvalidConfig);
    assert(bad_mode.error().message == "invalid (or unsupported) mode: 'rw'");
    assert(!httpfile::open(Url("http://fake/doc.txt"), "w", OpenOptions{.opener = fake_opener(res)}));

    OpenOptions unbuffered{.opener = fake_opener(res)};
    unbuffered.wrap.buffering = 0;
    auto text_unbuffered = httpfile::open(Url("http://fake/doc.txt"), "r", unbuffered);
    assert(!text_unbuffered && text_unbuffered.error().message == "can't have unbuffered text I/O");
    assert(res->opens == 0);

    auto binary = httpfile::open(Url("http://fake/doc.txt"), "rb", OpenOptions{.opener = fake_opener(res)});
    assert(binary && dynamic_cast<HttpFile*>(binary->get()) != nullptr);
    assert((*binary)->mode() == "rb");

    OpenOptions sized{.opener = fake_opener(res)};
    sized.wrap.buffering = 4096;
    auto binary_buffered = httpfile::open(Url("http://fake/doc.txt"), "br", sized);
    assert(binary_buffered);
    auto* buffered = dynamic_cast<BufferedReader*>(binary_buffered->get());
    assert(buffered && buffered->buffer_size() == 4096);
    assert(buffered->read_line().value() == "line 0\n");

    for (int size : {1, -1}) {
        OpenOptions options{.opener = fake_opener(res)};
        options.wrap.buffering = size;
        auto reader = httpfile::open(Url("http://fake/doc.txt"), "rb", options);
        auto* block = dynamic_cast<BufferedReader*>(reader->get());
        assert(block && block->buffer_size() == kDefaultBufferSize);
    }

    for (auto mode : {"r", "rt", "tr"}) {
        auto reader = httpfile::open(Url("http://fake/doc.txt"), mode, OpenOptions{.opener = fake_opener(res)});
        auto* text = dynamic_cast<TextReader*>(reader->get());
        assert(text && !text->line_buffering());
        auto* block = dynamic_cast<BufferedReader*>(&text->buffer());
        assert(block && block->buffer_size() == kDefaultBufferSize);
        assert(text->read_line().value() == "line 0\n");
    }

    OpenOptions line{.opener = fake_opener(res)};
    line.wrap.buffering = 1;
    line.wrap.text.encoding = "latin-1";
    auto line_buffered = httpfile::open(Url("http://fake/doc.txt"), "r", line);
    auto* text = dynamic_cast<TextReader*>(line_buffered->get());
    assert(text && text->line_buffering() && text->encoding() == "latin-1");
    std::cout << "✓ open modes and buffering\n";
}

void test_wrap_failures() {
    auto res = resource("abc");
    auto unbuffered = wrap(raw_file(res), true, WrapOptions{.buffering = 0});
    assert(!unbuffered && unbuffered.error().error == FileError::InvalidConfig);
    assert(res->closes == 1);

    auto bad_text = wrap(raw_file(res), true, WrapOptions{.text = TextOptions{.errors = "loud"}});
    assert(!bad_text && bad_text.error().error == FileError::InvalidConfig);
    std::cout << "✓ wrap rejects invalid layering\n";
}

int main() {
    test_buffered_reads();
    test_buffered_seeks();
    test_buffered_failed_seek_keeps_position();
    test_buffered_lines();
    test_buffered_non_seekable();
    test_text_utf8();
    test_text_errors();
    test_newline_modes();
    test_text_seek();
    test_open_modes();
    test_wrap_failures();
    std::cout << "All reader layer tests passed\n";
    return 0;
}
