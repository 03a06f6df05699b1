/**
 * @file MockByteSource.hpp
 * @brief Google Mock implementation of IByteSource
 */

#pragma once

#include "sources/IByteSource.hpp"
#include <gmock/gmock.h>

#include <algorithm>
#include <memory>
#include <string>

class MockByteSource : public IByteSource {
public:
    using OpenResult = std::expected<void, TransferError>;
    using ReadResult = std::expected<size_t, TransferError>;

    MOCK_METHOD(OpenResult, open, (), (override));
    MOCK_METHOD(ReadResult, read, (std::span<uint8_t> buffer), (override));
    MOCK_METHOD(uint64_t, size, (), (const, override));
    MOCK_METHOD(void, close, (), (override));
    MOCK_METHOD(std::string, describe, (), (const, override));

    // Factory for a source of @p size zero bytes
    static std::unique_ptr<testing::NiceMock<MockByteSource>> CreateDefault(uint64_t size = 4096) {
        auto mock = std::make_unique<testing::NiceMock<MockByteSource>>();
        auto remaining = std::make_shared<uint64_t>(size);

        ON_CALL(*mock, size())
            .WillByDefault(testing::Return(size));
        ON_CALL(*mock, describe())
            .WillByDefault(testing::Return("mock image"));
        ON_CALL(*mock, open())
            .WillByDefault([remaining, size]() -> OpenResult {
                *remaining = size;
                return {};
            });
        ON_CALL(*mock, read(testing::_))
            .WillByDefault([remaining](std::span<uint8_t> buffer) -> ReadResult {
                const auto n = static_cast<size_t>(std::min<uint64_t>(buffer.size(), *remaining));
                std::fill_n(buffer.begin(), n, uint8_t{0});
                *remaining -= n;
                return n;
            });

        return mock;
    }
};
