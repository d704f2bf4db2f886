// BONDVAULT - Asset Ledger Tests
// Copyright (c) 2024 BondVault Developers
// MIT License

#include <gtest/gtest.h>

#include "bondvault/vault/asset_ledger.h"
#include "../test_helpers.h"

#include <limits>

namespace bondvault {
namespace vault {
namespace test {

class AssetLedgerTest : public ::testing::Test {
protected:
    AssetLedger ledger_{"USDC", 6};
    const Address alice_ = MakeAddress(0xA1);
    const Address bob_ = MakeAddress(0xB0);
    const Address carol_ = MakeAddress(0xC0);
};

TEST_F(AssetLedgerTest, Metadata) {
    EXPECT_EQ(ledger_.Symbol(), "USDC");
    EXPECT_EQ(ledger_.Decimals(), 6);
    EXPECT_EQ(ledger_.TotalSupply(), 0u);
    EXPECT_OP_ERROR(AssetLedger("BAD", 19), ErrorCode::InvalidDecimals);
}

TEST_F(AssetLedgerTest, MintAndTransfer) {
    ledger_.Mint(alice_, 1000);
    EXPECT_EQ(ledger_.TotalSupply(), 1000u);

    ledger_.Transfer(alice_, bob_, 400);
    EXPECT_EQ(ledger_.BalanceOf(alice_), 600u);
    EXPECT_EQ(ledger_.BalanceOf(bob_), 400u);
    EXPECT_EQ(ledger_.TotalSupply(), 1000u);
}

TEST_F(AssetLedgerTest, TransferFailuresLeaveBalances) {
    ledger_.Mint(alice_, 100);
    EXPECT_OP_ERROR(ledger_.Transfer(alice_, bob_, 101), ErrorCode::InsufficientBalance);
    EXPECT_OP_ERROR(ledger_.Transfer(alice_, Address(), 1), ErrorCode::ZeroAddress);
    EXPECT_EQ(ledger_.BalanceOf(alice_), 100u);
    EXPECT_EQ(ledger_.BalanceOf(bob_), 0u);
}

TEST_F(AssetLedgerTest, SelfTransferIsNoop) {
    ledger_.Mint(alice_, 50);
    ledger_.Transfer(alice_, alice_, 50);
    EXPECT_EQ(ledger_.BalanceOf(alice_), 50u);
}

TEST_F(AssetLedgerTest, AllowanceIsSpent) {
    ledger_.Mint(alice_, 500);
    ledger_.Approve(alice_, bob_, 300);
    EXPECT_EQ(ledger_.Allowance(alice_, bob_), 300u);

    ledger_.TransferFrom(bob_, alice_, carol_, 200);
    EXPECT_EQ(ledger_.BalanceOf(carol_), 200u);
    EXPECT_EQ(ledger_.Allowance(alice_, bob_), 100u);

    EXPECT_OP_ERROR(ledger_.TransferFrom(bob_, alice_, carol_, 101),
                    ErrorCode::InsufficientAllowance);
    EXPECT_OP_ERROR(ledger_.TransferFrom(carol_, alice_, carol_, 1),
                    ErrorCode::InsufficientAllowance);
}

TEST_F(AssetLedgerTest, TransferFromKeepsAllowanceOnBalanceFailure) {
    ledger_.Mint(alice_, 10);
    ledger_.Approve(alice_, bob_, 100);
    EXPECT_OP_ERROR(ledger_.TransferFrom(bob_, alice_, bob_, 50), ErrorCode::InsufficientBalance);
    EXPECT_EQ(ledger_.Allowance(alice_, bob_), 100u);
}

TEST_F(AssetLedgerTest, ApproveZeroSpender) {
    EXPECT_OP_ERROR(ledger_.Approve(alice_, Address(), 1), ErrorCode::ZeroAddress);
}

TEST_F(AssetLedgerTest, MintOverflow) {
    ledger_.Mint(alice_, std::numeric_limits<Amount>::max());
    EXPECT_OP_ERROR(ledger_.Mint(bob_, 1), ErrorCode::ArithmeticOverflow);
    EXPECT_EQ(ledger_.BalanceOf(bob_), 0u);
}

} // namespace test
} // namespace vault
} // namespace bondvault
