#include "dsp/signal_decoder.hpp"
#include "dsp/spectral_analyzer.hpp"
#include "test_util.hpp"

#include <vector>

using namespace heartlight;

namespace {

// 18500 | 0 1 0 1 1 1 1  -> 47
const std::vector<int> kCode47 = {18500, 18750, 19500, 18750, 19500, 19250, 19500, 19250};
// 18500 | 1 0 1 0 0 0 0  -> 80
const std::vector<int> kCode80 = {18500, 19250, 19000, 19250, 19000, 18750, 19000, 18750};

int feed(SignalDecoder& decoder, const std::vector<int>& symbols, int repeats = 1) {
    int changes = 0;
    for (int s : symbols) {
        for (int r = 0; r < repeats; ++r) {
            if (decoder.update(test::map_for(s))) ++changes;
        }
    }
    return changes;
}

} // namespace

static void test_dominant_symbol() {
    test::section("dominant symbol");
    MagnitudeMap m = {{18500, 100}, {18750, 100}, {19000, 2000}, {19250, 100}, {19500, 100}};
    CHECK(SignalDecoder::dominant_symbol(m, 500, 3) == 19000);

    // Loud but not separated from the rest
    m = {{18500, 900}, {18750, 900}, {19000, 2000}, {19250, 900}, {19500, 900}};
    CHECK(SignalDecoder::dominant_symbol(m, 500, 3) == SignalDecoder::kNoSymbol);

    // Separated but under the floor
    m = {{18500, 10}, {18750, 10}, {19000, 499}, {19250, 10}, {19500, 10}};
    CHECK(SignalDecoder::dominant_symbol(m, 500, 3) == SignalDecoder::kNoSymbol);

    // Exactly on the floor counts
    m = {{18500, 0}, {18750, 0}, {19000, 500}, {19250, 0}, {19500, 0}};
    CHECK(SignalDecoder::dominant_symbol(m, 500, 3) == 19000);

    // Exactly 3x the mean does not
    m = {{18500, 200}, {18750, 200}, {19000, 600}, {19250, 200}, {19500, 200}};
    CHECK(SignalDecoder::dominant_symbol(m, 500, 3) == SignalDecoder::kNoSymbol);

    CHECK(SignalDecoder::dominant_symbol({}, 500, 3) == SignalDecoder::kNoSymbol);
    CHECK(SignalDecoder::dominant_symbol({{19000, 5000}}, 500, 3) == SignalDecoder::kNoSymbol);

    // Ties resolve to the first entry
    m = {{18500, 3000}, {18750, 3000}, {19000, 0}, {19250, 0}, {19500, 0}};
    CHECK(SignalDecoder::dominant_symbol(m, 0, 0) == 18500);
}

static void test_edge_sequence() {
    test::section("edge sequence");
    const std::vector<int> raw = {0, 18500, 18500, 0, 18500, 18750, 0, 0, 19500, 19500};
    const std::vector<int> expected = {18500, 18750, 19500};
    CHECK(SignalDecoder::edge_sequence(raw) == expected);
    CHECK(SignalDecoder::edge_sequence({0, 0, 0}).empty());
    CHECK(SignalDecoder::edge_sequence({}).empty());
}

static void test_find_code() {
    test::section("template match and decode");
    CHECK(SignalDecoder::find_code(kCode47) == 47);
    CHECK(SignalDecoder::find_code(kCode80) == 80);

    // Leading noise before the sync symbol
    std::vector<int> edges = {19000, 18750};
    edges.insert(edges.end(), kCode47.begin(), kCode47.end());
    CHECK(SignalDecoder::find_code(edges) == 47);

    // The most recent match wins
    edges = kCode47;
    edges.insert(edges.end(), kCode80.begin(), kCode80.end());
    CHECK(SignalDecoder::find_code(edges) == 80);

    // All-low and all-high choices
    CHECK(SignalDecoder::find_code({18500, 18750, 19000, 18750, 19000, 18750, 19000, 18750}) == 0);
    CHECK(SignalDecoder::find_code({18500, 19250, 19500, 19250, 19500, 19250, 19500, 19250}) == 127);

    CHECK(SignalDecoder::find_code({18500, 18750, 19500}) == SignalDecoder::kNoCode);
    CHECK(SignalDecoder::find_code({}) == SignalDecoder::kNoCode);

    // One foreign symbol inside the sequence breaks the match
    edges = {18500, 18750, 19500, 18750, 19000, 19500, 19250, 19500, 19250};
    CHECK(SignalDecoder::find_code(edges) == SignalDecoder::kNoCode);
}

static void test_update_events() {
    test::section("code-changed events");
    Config cfg;
    SignalDecoder decoder(cfg);
    CHECK(decoder.history_capacity() == 43);
    CHECK(decoder.current_code() == SignalDecoder::kNoCode);

    std::vector<int> events;
    decoder.set_code_changed_callback([&](int code) { events.push_back(code); });

    CHECK(feed(decoder, kCode47) == 1);
    CHECK(decoder.current_code() == 47);

    // Same code again: nothing new
    CHECK(feed(decoder, kCode47) == 0);

    CHECK(feed(decoder, kCode80) == 1);
    CHECK(decoder.current_code() == 80);
    CHECK((events == std::vector<int>{47, 80}));
    CHECK(decoder.last_symbol() == 18750);

    decoder.reset();
    CHECK(decoder.current_code() == SignalDecoder::kNoCode);
    CHECK(decoder.history().empty());
}

static void test_duplicates_and_gaps() {
    test::section("duplicates and silent blocks");
    Config cfg;
    SignalDecoder plain(cfg);
    SignalDecoder stretched(cfg);
    feed(plain, kCode47);
    feed(stretched, kCode47, 3);
    CHECK(plain.current_code() == 47);
    CHECK(stretched.current_code() == plain.current_code());

    SignalDecoder gapped(cfg);
    for (int s : kCode47) {
        gapped.update(test::map_for(s));
        gapped.update(test::map_for(SignalDecoder::kNoSymbol));
    }
    CHECK(gapped.current_code() == 47);
}

static void test_no_false_decode() {
    test::section("short or noisy histories");
    Config cfg;
    SignalDecoder decoder(cfg);
    int events = 0;
    decoder.set_code_changed_callback([&](int) { ++events; });

    // Seven distinct edges, however long they are held
    const std::vector<int> seven(kCode47.begin(), kCode47.begin() + 7);
    feed(decoder, seven, 4);
    CHECK(events == 0);

    // A history of silence and a single noise frame
    decoder.reset();
    for (int i = 0; i < 60; ++i) decoder.update(test::map_for(i == 30 ? 19000 : SignalDecoder::kNoSymbol));
    CHECK(events == 0);
    CHECK(decoder.current_code() == SignalDecoder::kNoCode);

    // History capacity ages a sequence out before it completes
    decoder.reset();
    feed(decoder, std::vector<int>(kCode47.begin(), kCode47.begin() + 4));
    for (int i = 0; i < decoder.history_capacity(); ++i) decoder.update(test::map_for(SignalDecoder::kNoSymbol));
    feed(decoder, std::vector<int>(kCode47.begin() + 4, kCode47.end()));
    CHECK(events == 0);
}

static void test_determinism() {
    test::section("independent decoders agree");
    Config cfg;
    for (int run = 0; run < 3; ++run) {
        SignalDecoder decoder(cfg);
        feed(decoder, kCode80, 2);
        CHECK(decoder.current_code() == 80);
    }
}

static void test_from_audio_blocks() {
    test::section("tone blocks through the analyzer");
    Config cfg;
    auto analyzer = SpectralAnalyzer::create(cfg);
    if (!CHECK(analyzer != nullptr)) return;

    std::vector<std::vector<int16_t>> blocks;
    for (int i = 0; i < 3; ++i) blocks.push_back(test::tone_block(cfg, 0, 0.0f));
    for (int s : kCode47) {
        for (int i = 0; i < 3; ++i) blocks.push_back(test::tone_block(cfg, s, 8000.0f));
    }

    int first_run = SignalDecoder::kNoCode;
    for (int run = 0; run < 2; ++run) {
        SignalDecoder decoder(cfg);
        for (const auto& b : blocks) {
            decoder.update(analyzer->analyze(b.data(), static_cast<int>(b.size())));
        }
        if (run == 0) {
            first_run = decoder.current_code();
            CHECK(first_run == 47);
        } else {
            CHECK(decoder.current_code() == first_run);
        }
    }
}

int main() {
    test_dominant_symbol();
    test_edge_sequence();
    test_find_code();
    test_update_events();
    test_duplicates_and_gaps();
    test_no_false_decode();
    test_determinism();
    test_from_audio_blocks();
    return test::finish("signal_decoder_test");
}
