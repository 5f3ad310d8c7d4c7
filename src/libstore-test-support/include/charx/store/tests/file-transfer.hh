#pragma once
///@file

#include "charx/store/filetransfer.hh"

#include <gmock/gmock.h>

namespace charx::testing {

class MockFileTransfer : public FileTransfer
{
public:
    MOCK_METHOD(FileTransferResult, transfer, (const FileTransferRequest & request), (override));
};

} // namespace charx::testing
