#pragma once

#include <set>
#include <string>

namespace service {
    // Lowercased project name with whitespace collapsed to dashes
    std::string projectSlug(const std::string &projectName);

    std::string containerName(const std::string &projectName, const std::string &branch);

    std::string imageName(const std::string &projectName, const std::string &branch);

    std::string domainFor(const std::string &projectName, const std::string &branch, const std::string &baseDomain,
                          const std::set<std::string> &productionBranches);

    // Names end up in container names, image tags, domains and filesystem paths. Letters, digits, '.', '_' and '-',
    // starting with a letter or digit and never containing "..". Project names may also contain spaces.
    bool isValidProjectName(const std::string &projectName);
    bool isValidBranchName(const std::string &branch);
    bool isValidEnvironmentName(const std::string &environment);

    bool isValidDomainName(const std::string &domain);

    std::string sanitizeDatabaseName(const std::string &name);

    std::string databaseContainerName(const std::string &name, const std::string &environment);
}
