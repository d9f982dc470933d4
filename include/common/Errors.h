#pragma once

#include <stdexcept>
#include <string>

namespace trendpilot {

// 심볼 데이터 조회 실패 (장 마감, 잘못된 심볼)
class DataUnavailable : public std::runtime_error {
public:
    explicit DataUnavailable(const std::string& what) : std::runtime_error(what) {}
};

class InsufficientHistory : public std::runtime_error {
public:
    explicit InsufficientHistory(const std::string& what) : std::runtime_error(what) {}
};

// ML / 패턴 / 센티먼트 등 선택적 신호 소스 실패
class OptionalSourceFailure : public std::runtime_error {
public:
    explicit OptionalSourceFailure(const std::string& what) : std::runtime_error(what) {}
};

class SizingInfeasible : public std::runtime_error {
public:
    explicit SizingInfeasible(const std::string& what) : std::runtime_error(what) {}
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// ===== 브로커 오류 =====

class BrokerError : public std::runtime_error {
public:
    BrokerError(const std::string& what, int code = 0)
        : std::runtime_error(what), code_(code) {}

    int code() const { return code_; }

private:
    int code_;
};

class OrderRejected : public BrokerError {
public:
    OrderRejected(const std::string& reason, int code = 0) : BrokerError(reason, code) {}
};

class ModifyRejected : public BrokerError {
public:
    ModifyRejected(const std::string& reason, int code = 0) : BrokerError(reason, code) {}
};

class CloseRejected : public BrokerError {
public:
    CloseRejected(const std::string& reason, int code = 0) : BrokerError(reason, code) {}
};

// 연결 계열 오류는 재시도 대상
class BrokerUnavailable : public BrokerError {
public:
    explicit BrokerUnavailable(const std::string& what, int code = 0) : BrokerError(what, code) {}
};

class BrokerTimeout : public BrokerUnavailable {
public:
    explicit BrokerTimeout(const std::string& what) : BrokerUnavailable(what) {}
};

} // namespace trendpilot
