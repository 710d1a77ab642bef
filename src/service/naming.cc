#include "naming.h"
#include "util.h"

#include <algorithm>

#define MAX_NAME_LENGTH 63

namespace service {
    namespace {
        bool isSafeName(const std::string &name, const std::string &extraChars) {
            if (name.empty() || name.size() > MAX_NAME_LENGTH || !std::isalnum(static_cast<unsigned char>(name.front())) || contains(name, "..")) {
                return false;
            }
            return std::ranges::all_of(name, [&extraChars](const unsigned char c) {
                return std::isalnum(c) || c == '.' || c == '_' || c == '-' || extraChars.find(static_cast<char>(c)) != std::string::npos;
            });
        }
    }

    bool isValidProjectName(const std::string &projectName) { return isSafeName(projectName, " "); }

    bool isValidBranchName(const std::string &branch) { return isSafeName(branch, ""); }

    bool isValidEnvironmentName(const std::string &environment) { return isSafeName(environment, ""); }

    bool isValidDomainName(const std::string &domain) {
        if (domain.empty() || domain.size() > 253 || domain.front() == '.' || contains(domain, "..")) {
            return false;
        }
        return std::ranges::all_of(domain, [](const unsigned char c) { return std::isalnum(c) || c == '.' || c == '-'; });
    }

    std::string projectSlug(const std::string &projectName) {
        std::string slug;
        bool whitespace = false;
        for (const unsigned char c: projectName) {
            if (std::isspace(c)) {
                if (!whitespace) {
                    slug += '-';
                }
                whitespace = true;
                continue;
            }
            whitespace = false;
            slug += static_cast<char>(std::tolower(c));
        }
        return slug;
    }

    std::string containerName(const std::string &projectName, const std::string &branch) { return projectSlug(projectName) + "-" + branch; }

    std::string imageName(const std::string &projectName, const std::string &branch) { return projectSlug(projectName) + ":" + branch; }

    std::string domainFor(const std::string &projectName, const std::string &branch, const std::string &baseDomain,
                          const std::set<std::string> &productionBranches) {
        const auto slug = projectSlug(projectName);
        if (productionBranches.contains(branch)) {
            return slug + "." + baseDomain;
        }
        return slug + "-" + branch + "." + baseDomain;
    }

    std::string sanitizeDatabaseName(const std::string &name) {
        std::string sanitized = strToLower(name);
        for (char &c: sanitized) {
            if (!(c >= 'a' && c <= 'z') && !(c >= '0' && c <= '9')) {
                c = '-';
            }
        }
        return sanitized;
    }

    std::string databaseContainerName(const std::string &name, const std::string &environment) {
        return sanitizeDatabaseName(name) + "-" + environment + "-postgres";
    }
}
