/*
 * 설명: 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/metrics_ops_test.cpp, server/tests/e2e/presence_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace fanout {

struct AppConfig {
  unsigned short port;
  std::string db_host;
  unsigned short db_port;
  std::string db_user;
  std::string db_password;
  std::string db_name;
  // mariadb | memory
  std::string store_backend;
  std::string log_level;
  std::size_t ws_queue_limit_messages;
  std::size_t ws_queue_limit_bytes;
  std::string ops_token;
};

AppConfig LoadConfigFromEnv();

}  // namespace fanout
