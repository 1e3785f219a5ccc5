/*
 * 설명: 엔진 결과를 JSON으로 직렬화하고 성공/오류 응답 엔벨로프를 만든다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/json_envelope_test.cpp
 */
#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "ranking/accuracy_evaluator.hpp"
#include "ranking/game_processor.hpp"
#include "ranking/models.hpp"
#include "ranking/ranking_engine.hpp"
#include "ranking/ranking_snapshot_service.hpp"
#include "ranking/season_audit.hpp"

namespace ranking {

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data);
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message,
                                 const nlohmann::json& detail = nullptr);

// ISO-8601 UTC ("2025-09-06T19:30:00Z").
std::string FormatTimestamp(const std::chrono::system_clock::time_point& tp);

nlohmann::json ToJson(const RankingEntry& entry);
nlohmann::json ToJson(const std::vector<RankingEntry>& entries);
nlohmann::json ToJson(const RankingSnapshot& snapshot);
nlohmann::json ToJson(const std::vector<RankingSnapshot>& snapshots);
nlohmann::json ToJson(const Prediction& prediction);
nlohmann::json ToJson(const std::vector<Prediction>& predictions);
nlohmann::json ToJson(const GameResult& result);
nlohmann::json ToJson(const AccuracyReport& report);
nlohmann::json ToJson(const AuditReport& report);
nlohmann::json ToJson(const BatchSummary& summary);

}  // namespace ranking
