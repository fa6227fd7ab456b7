#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <stdexcept>
#include <spdlog/spdlog.h>

#include "MarkovModel.hpp"
#include "Accumulator.hpp"
#include "Generator.hpp"
#include "Predictor.hpp"
#include "DemoOptions.hpp"

static void usage() {
    std::cerr << "usage: markov_demo [--order N] [--mode word|char] [--generate N] [--max-len N]\n"
                 "                   [--seed N] [--prompt TEXT] [--log-level LEVEL] [FILE]\n";
}

static bool ends_sentence(const std::string& word) {
    const char c = word.back();
    return c == '.' || c == '!' || c == '?';
}

// Word mode: whitespace separated tokens, a sentence ends at . ! or ?
static void train_words(std::istream& in, Accumulator<std::string>& acc) {
    std::string word;
    bool open = false;
    while (in >> word) {
        acc.add(word);
        open = true;
        if (ends_sentence(word)) {
            acc.end();
            open = false;
        }
    }
    if (open) acc.end();
}

// Char mode: every non-empty line is one sequence.
static void train_chars(std::istream& in, Accumulator<char>& acc) {
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        acc.add_sequence(line);
    }
}

static std::vector<std::string> tokenize(const std::string& text) {
    std::istringstream ss(text);
    std::vector<std::string> out;
    std::string w;
    while (ss >> w) out.push_back(w);
    return out;
}

static std::string join(const std::vector<std::string>& words) {
    std::string s;
    for (const auto& w : words) {
        if (!s.empty()) s += ' ';
        s += w;
    }
    return s;
}

static std::string join(const std::vector<char>& chars) {
    return std::string(chars.begin(), chars.end());
}

template <typename Symbol, typename TrainFn, typename PromptFn>
static void run(const DemoOptions& opt, std::istream& in, TrainFn&& train, PromptFn&& prompt_symbols) {
    MarkovModel<Symbol> model(opt.order);
    {
        Accumulator<Symbol> acc(model);
        train(in, acc);
    }
    spdlog::info("trained order-{} model: {} contexts, {} observations",
                 model.order(), model.num_contexts(), model.total_observations());

    if (!opt.prompt.empty()) {
        Predictor<Symbol> pre(model);
        for (const auto& s : prompt_symbols(opt.prompt)) pre.given(s);
        if (!model.contains(pre.context())) {
            spdlog::warn("prompt context was never seen in training");
        }
        std::cout << "prediction: " << opt.prompt << " | " << join(pre.continuation(opt.max_len)) << "\n";
    }

    Generator<Symbol> gen(model, Generator<Symbol>::uniform_source(opt.seed));
    for (size_t i = 0; i < opt.generate; ++i) {
        std::cout << "sample " << i + 1 << ": " << join(gen.generate(opt.max_len)) << "\n";
    }
}

int main(int argc, char** argv) {
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    try {
        DemoOptions opt = parse_args(argc, argv);
        if (opt.help) {
            usage();
            return 0;
        }
        spdlog::set_level(opt.log_level);

        std::ifstream file;
        if (!opt.input.empty()) {
            file.open(opt.input);
            if (!file) throw std::runtime_error("cannot open " + opt.input);
        }
        std::istream& in = opt.input.empty() ? std::cin : file;

        if (opt.char_mode) {
            run<char>(opt, in, train_chars,
                      [](const std::string& p) { return std::vector<char>(p.begin(), p.end()); });
        } else {
            run<std::string>(opt, in, train_words, tokenize);
        }
    } catch (const std::invalid_argument& e) {
        spdlog::error("{}", e.what());
        usage();
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
    return 0;
}
