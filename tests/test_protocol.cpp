// test_protocol.cpp - Wire codec tests for EKrut
// Copyright (C) 2026 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#include <gtest/gtest.h>

#include <ekrut/common/net/protocol.hpp>
#include <ekrut/common/net/tcp/tcp_message_handler.hpp>
#include "test_support.hpp"

using namespace EKrut;
using namespace EKrut::Protocol;
using EKrut::Net::TCP::ClientMessageType;
using EKrut::Net::TCP::MessageHandler;
using EKrut::Net::TCP::ServerMessageType;

TEST(Protocol, FieldsKeepEmptyEntries) {
    EXPECT_TRUE(decodeFields("").empty());
    EXPECT_EQ(decodeFields(std::string("a\x1F\x1F" "c")), (std::vector<std::string>{"a", "", "c"}));
    EXPECT_EQ(encodeFields({"alice", "pw1"}), std::string("alice\x1F" "pw1"));
}

TEST(Protocol, MalformedUserRecordsAreRejected) {
    EXPECT_FALSE(decodeUser("alice").has_value());
    EXPECT_FALSE(decodeUser(encodeFields({"alice", "", "WIZARD", "", "", "", "", "", ""})).has_value());
    EXPECT_FALSE(decodeUser(encodeFields({"", "", "CUSTOMER", "", "", "", "", "", ""})).has_value());

    auto user = decodeUser(encodeFields({"alice", "", "AREA_MANAGER", "Alice", "A", "1", "a@x", "050", "north"}));
    ASSERT_TRUE(user.has_value());
    EXPECT_EQ(user->type, UserType::AREA_MANAGER);
    EXPECT_EQ(user->area, "north");
}

TEST(Protocol, RegistrationMonthlyChargeMustBeBinary) {
    auto fields = std::vector<std::string>{"carol", "subscriber", "yes", "4580", "north", "C", "R", "c@x", "052"};
    EXPECT_FALSE(decodeRegistration(encodeFields(fields)).has_value());

    fields[2] = "1";
    auto registration = decodeRegistration(encodeFields(fields));
    ASSERT_TRUE(registration.has_value());
    EXPECT_TRUE(registration->monthlyCharge);
    EXPECT_TRUE(registration->isSubscriber());
}

TEST(Protocol, InvalidCredentialTravelsAsInvalidInputWithReason) {
    std::string payload = encodeUserResponse(UserResponse(SessionError::INVALID_CREDENTIAL));
    ASSERT_EQ(payload.size(), 2u);
    EXPECT_EQ(static_cast<uint8_t>(payload[0]), static_cast<uint8_t>(ResultType::INVALID_INPUT));
    EXPECT_EQ(static_cast<uint8_t>(payload[1]), kReasonInvalidCredential);

    payload = encodeUserResponse(UserResponse(SessionError::INVALID_INPUT));
    auto decoded = decodeUserResponse(payload);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->result, ResultType::INVALID_INPUT);
    EXPECT_FALSE(decoded->invalidCredential);
}

TEST(Protocol, ResponseRecordsAreSeparated) {
    UserResponse response;
    response.users.push_back(Testing::makeUser("alice", "", UserType::CUSTOMER));
    response.users.push_back(Testing::makeUser("bob", "", UserType::CUSTOMER));

    auto decoded = decodeUserResponse(encodeUserResponse(response));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->result, ResultType::OK);
    ASSERT_EQ(decoded->records.size(), 2u);
    EXPECT_EQ(decodeUser(decoded->records[1])->username, "bob");

    EXPECT_FALSE(decodeUserResponse("").has_value());
    EXPECT_FALSE(decodeUserResponse(std::string("\x07\x00", 2)).has_value());
}

TEST(Protocol, ResultMapping) {
    EXPECT_EQ(toResultType(SessionError::NONE), ResultType::OK);
    EXPECT_EQ(toResultType(SessionError::NOT_FOUND), ResultType::NOT_FOUND);
    EXPECT_EQ(resultTypeToString(ResultType::INVALID_INPUT), "INVALID_INPUT");
    EXPECT_EQ(sessionErrorToString(SessionError::INVALID_CREDENTIAL), "INVALID_CREDENTIAL");
    EXPECT_EQ(fetchUserTypeFromString("EMAIL"), FetchUserType::EMAIL);
    EXPECT_FALSE(fetchUserTypeFromString("email").has_value());
}

TEST(MessageFraming, HeaderCarriesTypeAndBigEndianLength) {
    std::string payload(300, 'x');
    auto data = MessageHandler::frame(ServerMessageType::USER_RESPONSE, payload);
    ASSERT_EQ(data.size(), 303u);
    EXPECT_EQ(data[0], 0x02);
    EXPECT_EQ(data[1], 0x01);
    EXPECT_EQ(data[2], 0x2C);

    auto empty = MessageHandler::frame(ClientMessageType::LOGOUT, "");
    EXPECT_EQ(empty, (std::vector<uint8_t>{0xA2, 0x00, 0x00}));
}

TEST(MessageFraming, SharedCodesDecodeAsClientMessages) {
    auto type = MessageHandler::decodeMessageType(0xA1);
    ASSERT_TRUE(std::holds_alternative<ClientMessageType>(type));
    EXPECT_EQ(std::get<ClientMessageType>(type), ClientMessageType::LOGIN);

    type = MessageHandler::decodeMessageType(0xFE);
    ASSERT_TRUE(std::holds_alternative<ClientMessageType>(type));
    EXPECT_EQ(std::get<ClientMessageType>(type), ClientMessageType::GRACEFUL_DISCONNECT);
    EXPECT_EQ(MessageHandler::toUint8(ServerMessageType::LOGOUT_NOTICE), 0x04);
}
