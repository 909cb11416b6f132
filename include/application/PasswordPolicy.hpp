#pragma once

#include "domain/User.hpp"
#include <string>
#include <vector>
#include <algorithm>
#include <cctype>

namespace clinic::application {

/**
 * @brief Требования к новому паролю
 *
 * - не короче 12 символов
 * - строчная и заглавная буква, цифра, спецсимвол из @$!%*?&
 * - не более двух одинаковых символов подряд
 * - не содержит имя, фамилию, табельный номер или часть email до @
 */
class PasswordPolicy {
public:
    static constexpr size_t kMinLength = 12;
    static constexpr const char* kSpecialCharacters = "@$!%*?&";

    /**
     * @return Список нарушений; пустой, если пароль подходит
     */
    std::vector<std::string> validate(const std::string& password, const domain::User& user) const {
        std::vector<std::string> errors;

        if (password.size() < kMinLength) {
            errors.push_back("must be at least " + std::to_string(kMinLength) + " characters");
        }

        bool lower = false, upper = false, digit = false, special = false;
        for (unsigned char c : password) {
            if (std::islower(c)) lower = true;
            else if (std::isupper(c)) upper = true;
            else if (std::isdigit(c)) digit = true;
            if (std::string(kSpecialCharacters).find(static_cast<char>(c)) != std::string::npos) special = true;
        }
        if (!lower) errors.push_back("must contain a lowercase letter");
        if (!upper) errors.push_back("must contain an uppercase letter");
        if (!digit) errors.push_back("must contain a digit");
        if (!special) errors.push_back("must contain a special character (@$!%*?&)");

        for (size_t i = 2; i < password.size(); ++i) {
            if (password[i] == password[i - 1] && password[i] == password[i - 2]) {
                errors.push_back("must not repeat a character 3 or more times in a row");
                break;
            }
        }

        std::string lowered = toLower(password);
        std::string emailLocal = user.email.substr(0, user.email.find('@'));
        std::vector<std::string> personal = {user.firstName, user.lastName, emailLocal};
        if (user.employeeId) {
            personal.push_back(*user.employeeId);
        }
        for (const auto& item : personal) {
            if (item.size() >= 3 && lowered.find(toLower(item)) != std::string::npos) {
                errors.push_back("must not contain personal information");
                break;
            }
        }

        return errors;
    }

private:
    static std::string toLower(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value;
    }
};

} // namespace clinic::application
