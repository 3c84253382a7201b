/**
 * @file MockTrashService.hpp
 * @brief Google Mock implementation of ITrashService
 */

#pragma once

#include "services/ITrashService.hpp"
#include <gmock/gmock.h>
#include <memory>

class MockTrashService : public ITrashService {
public:
    MOCK_METHOD((util::Result<std::vector<TrashItem>>), list, (), (override));
    MOCK_METHOD(util::Result<void>, trash, (const std::filesystem::path& path), (override));
    MOCK_METHOD(util::Result<void>, restore, (const TrashItem& item), (override));
    MOCK_METHOD(util::Result<void>, purge, (const TrashItem& item), (override));

    // Helper: Create a nice mock where every call succeeds on an empty trash
    static std::shared_ptr<MockTrashService> CreateNiceMock() {
        auto mock = std::make_shared<testing::NiceMock<MockTrashService>>();

        ON_CALL(*mock, list())
            .WillByDefault(testing::Return(util::Result<std::vector<TrashItem>>{}));
        ON_CALL(*mock, trash(testing::_))
            .WillByDefault(testing::Return(util::Result<void>{}));
        ON_CALL(*mock, restore(testing::_))
            .WillByDefault(testing::Return(util::Result<void>{}));
        ON_CALL(*mock, purge(testing::_))
            .WillByDefault(testing::Return(util::Result<void>{}));

        return mock;
    }

    // Helper: Error returned by restore() when the destination is occupied
    static util::Result<void> Collision(const std::string& destination) {
        return std::unexpected(util::Error{util::ErrorKind::RESTORE_COLLISION,
                                           "Destination already exists", EEXIST, destination});
    }

    // Helper: Any other trash failure
    static util::Result<void> Failure(const std::string& message) {
        return std::unexpected(util::Error{util::ErrorKind::TRASH, message});
    }
};
