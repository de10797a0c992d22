/*
 * Copyright (C) 2021 Open Source Robotics Foundation
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *
*/

#include "internal_Users.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace rental_booking {

namespace {

//==============================================================================
std::string normalize_email(std::string email)
{
  const auto not_space = [](unsigned char c) { return !std::isspace(c); };
  email.erase(email.begin(), std::find_if(email.begin(), email.end(), not_space));
  email.erase(std::find_if(email.rbegin(), email.rend(), not_space).base(),
    email.end());

  std::transform(email.begin(), email.end(), email.begin(),
    [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  return email;
}

} // anonymous namespace

//==============================================================================
const char* const User::Implementation::Columns =
  "user_id, email, full_name, role, created_at";

//==============================================================================
User User::Implementation::read(const Statement& row)
{
  const std::string role_name = row.column_text(3);
  const auto role = role_from_string(role_name);
  if (!role)
  {
    throw storage_error(
      describe("Users", "Stored user [" + std::to_string(row.column_id(0))
        + "] has an unknown role [" + role_name + "]"), SQLITE_MISMATCH);
  }

  User user;
  user._pimpl = rmf_utils::make_impl<Implementation>(
    Implementation{
      row.column_id(0),
      row.column_text(1),
      row.column_text(2),
      *role,
      row.column_text(4)
    });

  return user;
}

//==============================================================================
User::User()
{
  // Do nothing
}

//==============================================================================
UserId User::id() const
{
  return _pimpl->id;
}

//==============================================================================
const std::string& User::email() const
{
  return _pimpl->email;
}

//==============================================================================
const std::string& User::full_name() const
{
  return _pimpl->full_name;
}

//==============================================================================
Role User::role() const
{
  return _pimpl->role;
}

//==============================================================================
const std::string& User::created_at() const
{
  return _pimpl->created_at;
}

//==============================================================================
std::optional<User> Users::Implementation::find(
  const Transaction& transaction,
  const UserId id)
{
  auto statement = transaction.prepare(
    std::string("SELECT ") + User::Implementation::Columns
    + " FROM users WHERE user_id = ?;");
  statement.bind_id(1, id);

  if (!statement.step())
    return std::nullopt;

  return User::Implementation::read(statement);
}

//==============================================================================
User Users::Implementation::get(
  const Transaction& transaction,
  const UserId id)
{
  auto user = find(transaction, id);
  if (!user)
  {
    throw not_found_error(
      describe(transaction.operation(), "No user with id ["
        + std::to_string(id) + "]"));
  }

  return *std::move(user);
}

//==============================================================================
User Users::Implementation::add(
  const std::string& operation,
  std::string email,
  std::string full_name,
  const Role role)
{
  email = normalize_email(std::move(email));
  if (email.empty() || full_name.empty())
  {
    throw std::invalid_argument(
      describe(operation, "A user needs an email and a full name"));
  }

  std::optional<User> user;
  {
    Transaction transaction(
      Database::Implementation::get(*database),
      Transaction::Mode::Write, operation);

    auto existing = transaction.prepare(
      "SELECT user_id FROM users WHERE email = ?;");
    existing.bind_text(1, email);
    if (existing.step())
    {
      throw std::invalid_argument(
        describe(operation, "The email [" + email + "] is already registered"));
    }

    transaction.prepare(
      "INSERT INTO users (email, full_name, role) VALUES (?, ?, ?);")
    .bind_text(1, email)
    .bind_text(2, full_name)
    .bind_text(3, to_string(role))
    .run();

    user = get(transaction, transaction.last_insert_id());
    transaction.commit();
  }

  database->logger().info(
    describe(operation, "Registered " + to_string(role) + " ["
      + std::to_string(user->id()) + "] " + user->email()));

  return *std::move(user);
}

//==============================================================================
Users::Users(std::shared_ptr<Database> database)
: _pimpl(rmf_utils::make_impl<Implementation>(
      Implementation{std::move(database)}))
{
  // Do nothing
}

//==============================================================================
User Users::add(std::string email, std::string full_name, const Role role)
{
  return _pimpl->add(
    "Users::add", std::move(email), std::move(full_name), role);
}

//==============================================================================
User Users::add(
  const Actor& actor,
  std::string email,
  std::string full_name,
  const Role role)
{
  const std::string operation = "Users::add";
  actor.require(Action::ManageUsers, operation);
  return _pimpl->add(operation, std::move(email), std::move(full_name), role);
}

//==============================================================================
User Users::get(const UserId id) const
{
  Transaction transaction(
    Database::Implementation::get(*_pimpl->database),
    Transaction::Mode::Read, "Users::get");
  return Implementation::get(transaction, id);
}

//==============================================================================
std::optional<User> Users::find(const UserId id) const
{
  Transaction transaction(
    Database::Implementation::get(*_pimpl->database),
    Transaction::Mode::Read, "Users::find");
  return Implementation::find(transaction, id);
}

//==============================================================================
std::optional<User> Users::find_by_email(const std::string& email) const
{
  Transaction transaction(
    Database::Implementation::get(*_pimpl->database),
    Transaction::Mode::Read, "Users::find_by_email");

  auto statement = transaction.prepare(
    std::string("SELECT ") + User::Implementation::Columns
    + " FROM users WHERE email = ?;");
  statement.bind_text(1, normalize_email(email));

  if (!statement.step())
    return std::nullopt;

  return User::Implementation::read(statement);
}

//==============================================================================
std::vector<User> Users::list(const std::optional<Role> role) const
{
  Transaction transaction(
    Database::Implementation::get(*_pimpl->database),
    Transaction::Mode::Read, "Users::list");

  std::string sql = std::string("SELECT ") + User::Implementation::Columns
    + " FROM users";
  if (role)
    sql += " WHERE role = ?";
  sql += " ORDER BY user_id;";

  auto statement = transaction.prepare(sql);
  if (role)
    statement.bind_text(1, to_string(*role));

  std::vector<User> users;
  while (statement.step())
    users.push_back(User::Implementation::read(statement));

  return users;
}

} // namespace rental_booking
