#include <mcp_guard/mcp/procedure.hpp>

#include <algorithm>

namespace mcp_guard {

nlohmann::json InvokeProcedure(const Procedure& procedure, const nlohmann::json& input,
                               const CallContext& context) {
    auto parsed = ParseInput(procedure.input, input);
    if (parsed.IsErr()) {
        throw ProcedureError(ProcedureError::Kind::InvalidInput, parsed.Error().message);
    }
    if (!procedure.handler) {
        throw ProcedureError(ProcedureError::Kind::Failed,
                             "Procedure '" + procedure.path + "' has no handler");
    }
    return procedure.handler(parsed.Value(), context);
}

Result<void, Error> ProcedureSet::Add(Procedure procedure) {
    if (procedure.path.empty()) {
        return Result<void, Error>::Err(Error{
            "ProcedureSet::Add", "procedure path must not be empty", ErrorCategory::Validation});
    }
    std::lock_guard<std::mutex> lock(mutex_);
    const auto exists = std::any_of(
        procedures_.begin(), procedures_.end(),
        [&](const std::shared_ptr<const Procedure>& p) { return p->path == procedure.path; });
    if (exists) {
        return Result<void, Error>::Err(Error{
            "ProcedureSet::Add", "procedure '" + procedure.path + "' already registered",
            ErrorCategory::Validation});
    }
    procedures_.push_back(std::make_shared<const Procedure>(std::move(procedure)));
    ++version_;
    return Result<void, Error>::Ok();
}

bool ProcedureSet::Remove(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(procedures_.begin(), procedures_.end(),
                           [&](const std::shared_ptr<const Procedure>& p) {
                               return p->path == path;
                           });
    if (it == procedures_.end()) {
        return false;
    }
    procedures_.erase(it);
    ++version_;
    return true;
}

std::vector<std::shared_ptr<const Procedure>> ProcedureSet::All() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return procedures_;
}

std::shared_ptr<const Procedure> ProcedureSet::Find(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& p : procedures_) {
        if (p->path == path) {
            return p;
        }
    }
    return nullptr;
}

std::uint64_t ProcedureSet::Version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return version_;
}

std::size_t ProcedureSet::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return procedures_.size();
}

} // namespace mcp_guard
