#pragma once

// cmd_match: group a product batch across suppliers and report price comparisons.
// Usage: spme_cli match --input <file> [--config <json>] [--mode text|image|hybrid]
//                       [--threshold <0..1>] [--blocking none|first_bigram|price_band]
//                       [--hash dhash|ahash] [--workers <n>] [--strip-noise]
//                       [--db <sqlite path>] [--no-pairs] [--features] [--show-audit]
// Flags override values read from --config regardless of their order.
int cmd_match(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
