#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>

#include "domain/Errors.hpp"
#include "infrastructure/Credentials.hpp"
#include "infrastructure/EmployeeRepositoryFs.hpp"
#include "infrastructure/RecordCodec.hpp"
#include "infrastructure/RecordStore.hpp"

using namespace staffledger;
using namespace staffledger::domain;
using namespace staffledger::infrastructure;
namespace fs = std::filesystem;

namespace {

NewEmployee MakeEmployee(const std::string& email) {
    NewEmployee e;
    e.email = email;
    e.password = "s3cret";
    e.firstName = "Ada";
    e.lastName = "Lovelace";
    e.department = "Engineering";
    e.hireDate = CalendarDate(2022, 5, 17);
    return e;
}

} // namespace

int main() {
    std::cout << "[Test] Starting EmployeeRepository Test..." << std::endl;

    fs::path testRoot = fs::temp_directory_path() / ("staffledger_employees_" + Credentials::NewId());
    auto store = std::make_shared<RecordStore>(testRoot);
    EmployeeRepositoryFs repo(store);

    // Distinct emails all succeed.
    Employee ada = repo.create(MakeEmployee("ada@example.com"));
    Employee bob = repo.create(MakeEmployee("bob@example.com"));
    assert(ada.id != bob.id);
    assert(repo.findAll().size() == 2);
    assert(ada.isActive);
    assert(ada.createdAt == ada.updatedAt);
    assert(ada.passwordHash != "s3cret");
    assert(Credentials::VerifyPassword("s3cret", ada.passwordHash));
    std::cout << "[PASS] Create with distinct emails" << std::endl;

    // Duplicate email fails and leaves the collection unchanged.
    bool conflict = false;
    try {
        repo.create(MakeEmployee("ada@example.com"));
    } catch (const ConflictError&) {
        conflict = true;
    }
    assert(conflict);
    assert(repo.findAll().size() == 2);
    std::cout << "[PASS] Duplicate email rejected" << std::endl;

    // Lookups.
    auto byEmail = repo.findByEmail("bob@example.com");
    assert(byEmail && byEmail->id == bob.id);
    assert(!repo.findById("missing"));
    assert(!repo.findByEmail("nobody@example.com"));

    // Stored values survive a fresh repository over the same directory.
    {
        EmployeeRepositoryFs reopened(std::make_shared<RecordStore>(testRoot));
        auto again = reopened.findById(ada.id);
        assert(again);
        assert(again->email == "ada@example.com");
        assert(again->hireDate == CalendarDate(2022, 5, 17));
        assert(again->department && *again->department == "Engineering");
        assert(!again->managerId);
        assert(again->createdAt == ada.createdAt);
    }

    // Empty update changes only updated_at.
    EmployeeUpdate nothing;
    assert(nothing.empty());
    auto touched = repo.update(ada.id, nothing);
    assert(touched);
    assert(touched->updatedAt >= ada.updatedAt);
    Record before = EncodeEmployee(ada);
    Record after = EncodeEmployee(*touched);
    before.erase("updated_at");
    after.erase("updated_at");
    assert(before == after);
    std::cout << "[PASS] Empty update only touches updated_at" << std::endl;

    // Partial update, including clearing a nullable field.
    EmployeeUpdate change;
    change.managerId = std::optional<std::string>(bob.id);
    change.department = std::optional<std::string>();
    change.position = std::optional<std::string>("Analyst");
    auto changed = repo.update(ada.id, change);
    assert(changed);
    assert(changed->managerId && *changed->managerId == bob.id);
    assert(!changed->department);
    assert(changed->position && *changed->position == "Analyst");
    assert(changed->firstName == "Ada");
    assert(repo.findDirectReports(bob.id).size() == 1);

    // Email change onto another row's email conflicts and changes nothing.
    EmployeeUpdate steal;
    steal.email = std::string("bob@example.com");
    conflict = false;
    try {
        repo.update(ada.id, steal);
    } catch (const ConflictError&) {
        conflict = true;
    }
    assert(conflict);
    assert(repo.findById(ada.id)->email == "ada@example.com");
    assert(!repo.update("missing", change));
    std::cout << "[PASS] Partial updates" << std::endl;

    // Soft delete keeps the row and still blocks its email.
    assert(repo.deactivate(bob.id));
    assert(!repo.deactivate("missing"));
    auto inactive = repo.findById(bob.id);
    assert(inactive && !inactive->isActive);
    assert(repo.findAll().size() == 2);
    conflict = false;
    try {
        repo.create(MakeEmployee("bob@example.com"));
    } catch (const ConflictError&) {
        conflict = true;
    }
    assert(conflict);
    std::cout << "[PASS] Soft delete" << std::endl;

    // A corrupt employees file reads as empty and accepts new rows.
    {
        std::ofstream out(store->collectionPath("employees"), std::ios::trunc);
        out << "not json";
    }
    assert(repo.findAll().empty());
    Employee fresh = repo.create(MakeEmployee("ada@example.com"));
    assert(repo.findAll().size() == 1);
    assert(repo.findById(fresh.id));
    std::cout << "[PASS] Recovery after corruption" << std::endl;

    fs::remove_all(testRoot);
    std::cout << "[Test] EmployeeRepository Test Passed!" << std::endl;
    return 0;
}
