#include "User.hpp"

User::User(const std::string& user_id, const std::string& name,
    const std::string& salt_hex, std::int64_t rotated_at)
    : id(user_id), username(name), flag_salt(salt_hex),
    salt_rotated_at(rotated_at), created_at(rotated_at)
{
}
