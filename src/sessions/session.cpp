#include "tracescope/sessions/session.hpp"

#include "tracescope/conversation/reconstructor.hpp"
#include "tracescope/sessions/project.hpp"
#include "tracescope/sessions/statistics.hpp"

namespace tracescope::sessions {

std::optional<Session> reconstruct_session(const std::filesystem::path &file_path,
                                           const transcript::DecodeResult &decoded) {
  if (decoded.entries.empty()) {
    return std::nullopt;
  }

  auto pairs = conversation::ConversationReconstructor::reconstruct(decoded.entries);
  if (pairs.empty()) {
    return std::nullopt;
  }

  Session session;
  session.file_path = file_path;
  session.session_id = extract_session_id(decoded.entries, decoded.head_lines);
  session.full_session_id = extract_full_session_id(file_path, session.session_id);
  session.project_name =
      extract_project_name(decoded.entries, file_path, file_path.extension().string());
  session.project_path =
      extract_project_path(decoded.first_entry, file_path, session.project_name);
  session.pairs = std::move(pairs);
  session.metrics = calculate_metrics(session.pairs);
  session.summary = generate_summary(session.pairs);
  return session;
}

} // namespace tracescope::sessions
