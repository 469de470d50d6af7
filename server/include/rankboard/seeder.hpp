/*
 * 설명: 서버 시작 시 임의 이름/점수의 초기 경쟁자를 생성한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/seeder_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <random>

#include "rankboard/leaderboard.hpp"
#include "rankboard/observability.hpp"

namespace rankboard {

std::size_t SeedCompetitors(Leaderboard& leaderboard, std::size_t count, std::mt19937_64& rng,
                            const std::shared_ptr<Observability>& observability);

}  // namespace rankboard
