#include <cstddef>

#include <sys/uio.h>

#include "sdjournal/api.hpp"
#include "sdjournal/writer.hpp"

namespace sdjournal {

namespace {

Error sendv(const std::vector<std::string> &records) {
  const Api *api = NULL;
  Error err = load_api(&api);
  if (!err.ok()) {
    return err;
  }
  std::vector<struct iovec> iov(records.size());
  for (size_t i = 0; i < records.size(); ++i) {
    iov[i].iov_base = (void *)(records[i].data());
    iov[i].iov_len = records[i].size();
  }
  return Error::from_return(api->sendv(iov.data(), (int)(iov.size())));
}

} // namespace

Error submit(const Entry &entry) {
  if (entry.empty()) {
    return Error::validation(EINVAL);
  }
  std::vector<std::string> records;
  records.reserve(entry.fields().size());
  for (const auto &[name, value] : entry.fields()) {
    if (!is_valid_field_name(name)) {
      return Error::validation(EINVAL);
    }
    std::string record;
    record.reserve(name.size() + 1 + value.size());
    record.append(name);
    record.push_back('=');
    record.append(value);
    records.push_back(std::move(record));
  }
  return sendv(records);
}

Error send(const std::vector<std::string> &fields) {
  if (fields.empty()) {
    return Error::validation(EINVAL);
  }
  for (const std::string &field : fields) {
    size_t eq_pos = field.find('=');
    if (eq_pos == field.npos ||
        !is_valid_field_name(std::string_view(field).substr(0, eq_pos))) {
      return Error::validation(EINVAL);
    }
  }
  return sendv(fields);
}

Error print(int priority, std::string_view message) {
  if (priority < 0 || priority > 7) {
    return Error::validation(EINVAL);
  }
  Entry entry;
  entry.set_priority(priority);
  entry.set_message(std::string(message));
  return submit(entry);
}

} // namespace sdjournal
