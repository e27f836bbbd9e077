#include "commands/rank.hpp"
#include "commands/run.hpp"
#include "commands/stats.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  wordspace stats [args]\n"
        << "  wordspace rank [args]\n"
        << "  wordspace run [args]\n"
        << "  wordspace help\n";
    return 1;
}

static void print_common_help() {
    std::cerr
        << "inputs:\n"
        << "  --corpus <path>              (required) ';'-delimited records, col 1 = document, col 5 = text\n"
        << "  --vocab <path>               (required) one token per line\n"
        << "\n"
        << "config:\n"
        << "  --config <path>              optional JSON: window_size, epsilon, top_k\n"
        << "  --window <n>                 default: 4\n"
        << "  --epsilon <f>                default: 1e-10\n"
        << "  --topk <n>                   default: 10\n"
        << "  --out <path>                 optional: mirror console output to a file\n";
}

static int print_stats_help() {
    std::cerr
        << "usage:\n"
        << "  wordspace stats --corpus <path> --vocab <path> [options]\n"
        << "\n";
    print_common_help();
    return 0;
}

static int print_rank_help() {
    std::cerr
        << "usage:\n"
        << "  wordspace rank --corpus <path> --vocab <path> (--doc <name> | --word <token>) [options]\n"
        << "\n"
        << "ranking:\n"
        << "  --matrix <td|tfidf|tc|ppmi>  default: td for --doc, ppmi for --word\n"
        << "  --metric <name>              cosine | jaccard | dice | all (default: all)\n"
        << "  --report <path>              optional: write JSON report\n"
        << "\n";
    print_common_help();
    return 0;
}

static int print_run_help() {
    std::cerr
        << "usage:\n"
        << "  wordspace run --corpus <path> --vocab <path> [options]\n"
        << "\n"
        << "exploration:\n"
        << "  --word <token>               default: gain\n"
        << "  --seed <n>                   seed for the random document pick\n"
        << "  --report <path>              optional: write JSON report\n"
        << "\n";
    print_common_help();
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help") {
        return print_usage();
    }

    // subcommand help
    if (cmd == "stats" && (argc >= 3 && std::string(argv[2]) == "--help")) return print_stats_help();
    if (cmd == "rank"  && (argc >= 3 && std::string(argv[2]) == "--help")) return print_rank_help();
    if (cmd == "run"   && (argc >= 3 && std::string(argv[2]) == "--help")) return print_run_help();

    if (cmd == "stats") return cmd_stats(argc - 1, argv + 1);
    if (cmd == "rank")  return cmd_rank(argc - 1, argv + 1);
    if (cmd == "run")   return cmd_run(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
