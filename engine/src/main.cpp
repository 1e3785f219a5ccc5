/*
 * 설명: 배치 진입점. 환경설정을 로드해 한 시즌의 지정 주차까지 처리하고 요약을 출력한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/ranking_engine_test.cpp, engine/tests/it/mariadb_store_it_test.cpp
 */
#include <iostream>
#include <memory>
#include <stdexcept>

#include "ranking/api_response.hpp"
#include "ranking/config.hpp"
#include "ranking/db_client.hpp"
#include "ranking/mariadb_store.hpp"
#include "ranking/observability.hpp"
#include "ranking/ranking_engine.hpp"

int main() {
  using namespace ranking;
  try {
    EngineConfig config = LoadConfigFromEnv();
    auto observability = std::make_shared<Observability>(ParseLogLevel(config.log_level));
    DbConfig db_config{config.db_host, config.db_port, config.db_user, config.db_password, config.db_name};
    auto db_client = std::make_shared<MariaDbClient>(db_config);
    auto store = std::make_shared<MariaDbRatingStore>(db_client);
    store->EnsureSchema();

    RankingEngine engine(store, observability, config.rating);
    BatchSummary summary = engine.RunBatch(config.season, config.week);
    std::cout << MakeSuccessEnvelope(ToJson(summary)).dump() << std::endl;
    // 감사 오류가 있으면 운영자가 알 수 있도록 비정상 종료 코드를 반환한다.
    return summary.audit.Passed() ? 0 : 2;
  } catch (const DbException& ex) {
    std::cout << MakeErrorEnvelope("db_error", ex.what(), {{"dbCode", ex.code}, {"retryable", ex.retryable}}).dump()
              << std::endl;
  } catch (const std::exception& ex) {
    std::cout << MakeErrorEnvelope("internal_error", ex.what()).dump() << std::endl;
  }
  return 1;
}
