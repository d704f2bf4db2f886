// BONDVAULT - Bond Registry Tests
// Copyright (c) 2024 BondVault Developers
// MIT License

#include <gtest/gtest.h>

#include "bondvault/vault/bond_registry.h"
#include "../test_helpers.h"

namespace bondvault {
namespace vault {
namespace test {

TEST(BondRegistryTest, MintAssignsSequentialIds) {
    BondRegistry registry;
    EXPECT_EQ(registry.Mint(MakeAddress(1)), 1u);
    EXPECT_EQ(registry.Mint(MakeAddress(2)), 2u);
    EXPECT_EQ(registry.Count(), 2u);
    EXPECT_EQ(registry.OwnerOf(2), MakeAddress(2));
    EXPECT_TRUE(registry.Exists(1));
    EXPECT_FALSE(registry.Exists(3));
}

TEST(BondRegistryTest, UnknownBond) {
    BondRegistry registry;
    EXPECT_OP_ERROR(registry.OwnerOf(1), ErrorCode::NonexistentBond);
    EXPECT_OP_ERROR(registry.Transfer(MakeAddress(1), MakeAddress(2), 1),
                    ErrorCode::NonexistentBond);
}

TEST(BondRegistryTest, TransferChangesOwner) {
    BondRegistry registry;
    BondId id = registry.Mint(MakeAddress(1));

    EXPECT_OP_ERROR(registry.Transfer(MakeAddress(2), MakeAddress(3), id),
                    ErrorCode::NotBondOwner);
    EXPECT_OP_ERROR(registry.Transfer(MakeAddress(1), Address(), id),
                    ErrorCode::ZeroAddress);

    registry.Transfer(MakeAddress(1), MakeAddress(3), id);
    EXPECT_EQ(registry.OwnerOf(id), MakeAddress(3));
}

TEST(BondRegistryTest, MintToZeroAddress) {
    BondRegistry registry;
    EXPECT_OP_ERROR(registry.Mint(Address()), ErrorCode::ZeroAddress);
    EXPECT_EQ(registry.Count(), 0u);
}

} // namespace test
} // namespace vault
} // namespace bondvault
