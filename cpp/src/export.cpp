/**
 * @file export.cpp
 * @brief CSV writers for per-game and per-deal rows.
 */

#include "../include/cribbage/export.hpp"
#include <stdexcept>

namespace cribbage {

std::string csv_escape(const std::string& field) {
    if (field.find_first_of(",\"\n\r") == std::string::npos) {
        return field;
    }
    std::string out = "\"";
    for (char c : field) {
        if (c == '"') out += '"';
        out += c;
    }
    out += "\"";
    return out;
}

std::string csv_join(const std::vector<std::string>& fields) {
    std::string line;
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) line += ",";
        line += csv_escape(fields[i]);
    }
    return line;
}

const std::vector<std::string>& summary_fieldnames() {
    static const std::vector<std::string> names = {
        "game_number", "winner",
        "player1_final_score", "player2_final_score", "hands_played",
        "player1_play_points", "player1_count_points", "player1_heels_points",
        "player2_play_points", "player2_count_points", "player2_heels_points",
        "random_seed"
    };
    return names;
}

namespace {

const ScoreCategory COUNT_CATEGORIES[] = {
    ScoreCategory::FIFTEENS, ScoreCategory::PAIRS, ScoreCategory::RUNS,
    ScoreCategory::FLUSH, ScoreCategory::NOBS
};

void append_count_columns(std::vector<std::string>& names, const std::string& prefix) {
    for (ScoreCategory c : COUNT_CATEGORIES) {
        names.push_back(prefix + category_name(c));
    }
}

void append_breakdown(std::vector<std::string>& row, const ScoreBreakdown& breakdown,
                      bool counted) {
    row.push_back(counted ? std::to_string(breakdown.total()) : "");
    for (ScoreCategory c : COUNT_CATEGORIES) {
        row.push_back(counted ? std::to_string(breakdown.get(c)) : "");
    }
}

std::vector<std::string> build_hand_fieldnames() {
    std::vector<std::string> names = {"game_number", "hand_number", "dealer"};
    for (const char* p : {"p1", "p2"}) {
        std::string prefix(p);
        names.push_back(prefix + "_dealt_cards");
        names.push_back(prefix + "_kept_cards");
        names.push_back(prefix + "_discards");
        names.push_back(prefix + "_hand_score");
        append_count_columns(names, prefix + "_hand_");
        names.push_back(prefix + "_score_before");
        names.push_back(prefix + "_score_after");
    }
    names.push_back("crib_cards");
    names.push_back("crib_score");
    append_count_columns(names, "crib_");
    names.push_back("starter_card");
    names.push_back("his_heels");
    return names;
}

std::ofstream open_csv(const std::string& path) {
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Cannot open CSV file: " + path);
    }
    return out;
}

} // namespace

const std::vector<std::string>& hand_fieldnames() {
    static const std::vector<std::string> names = build_hand_fieldnames();
    return names;
}

std::vector<std::string> summary_row(const GameSummary& summary) {
    return {
        std::to_string(summary.game_id),
        summary.winner_name(),
        std::to_string(summary.final_scores[0]),
        std::to_string(summary.final_scores[1]),
        std::to_string(summary.hands_played),
        std::to_string(summary.play_points[0]),
        std::to_string(summary.count_points[0]),
        std::to_string(summary.heels_points[0]),
        std::to_string(summary.play_points[1]),
        std::to_string(summary.count_points[1]),
        std::to_string(summary.heels_points[1]),
        summary.seed_tracked ? std::to_string(summary.seed) : ""
    };
}

std::vector<std::string> hand_row(const DealRecord& record) {
    std::vector<std::string> row = {
        std::to_string(record.game_id),
        std::to_string(record.hand_id),
        record.players[record.dealer].name
    };

    for (const PlayerDealRecord& p : record.players) {
        row.push_back(cards_to_string(p.dealt));
        row.push_back(cards_to_string(p.kept));
        row.push_back(cards_to_string(p.discards));
        append_breakdown(row, p.hand_breakdown, p.hand_counted);
        row.push_back(std::to_string(p.score_before));
        row.push_back(std::to_string(p.score_after));
    }

    row.push_back(cards_to_string(record.crib));
    append_breakdown(row, record.crib_breakdown, record.crib_counted);
    row.push_back(card_to_string(record.starter));
    row.push_back(record.his_heels ? "True" : "False");
    return row;
}

CsvSummaryExporter::CsvSummaryExporter(const std::string& path)
    : out_(open_csv(path)), rows_(0) {
    out_ << csv_join(summary_fieldnames()) << "\n";
    out_.flush();
}

void CsvSummaryExporter::on_game_complete(const GameSummary& summary) {
    out_ << csv_join(summary_row(summary)) << "\n";
    out_.flush();
    ++rows_;
}

CsvHandExporter::CsvHandExporter(const std::string& path)
    : out_(open_csv(path)), rows_(0) {
    out_ << csv_join(hand_fieldnames()) << "\n";
    out_.flush();
}

void CsvHandExporter::on_deal_complete(const DealRecord& record) {
    out_ << csv_join(hand_row(record)) << "\n";
    out_.flush();
    ++rows_;
}

} // namespace cribbage
