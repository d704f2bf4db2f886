// BONDVAULT - Shared Test Helpers
// Copyright (c) 2024 BondVault Developers
// MIT License

#ifndef BONDVAULT_TESTS_TEST_HELPERS_H
#define BONDVAULT_TESTS_TEST_HELPERS_H

#include <gtest/gtest.h>

#include "bondvault/core/errors.h"

/// Expect `stmt` to throw OperationError carrying `code`
#define EXPECT_OP_ERROR(stmt, code)                                              \
    do {                                                                         \
        try {                                                                    \
            stmt;                                                                \
            ADD_FAILURE() << "expected " << ::bondvault::ErrorCodeToString(code); \
        } catch (const ::bondvault::OperationError& e_) {                        \
            EXPECT_EQ(e_.Code(), code) << e_.what();                             \
        }                                                                        \
    } while (0)

#endif // BONDVAULT_TESTS_TEST_HELPERS_H
