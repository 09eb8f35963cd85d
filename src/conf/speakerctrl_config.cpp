#include "conf/speakerctrl_config.hpp"

#include <fstream>
#include <iterator>

namespace speakerctrl {

monad::MyVoidResult
SpeakerctrlConfigProviderFile::save(const json::object &content) {
  auto f = config_sources_.writable_dir() / "application.override.json";
  json::object merged;
  if (fs::exists(f)) {
    std::ifstream ifs(f);
    if (!ifs) {
      return monad::MyVoidResult::Err(
          {.code = my_errors::GENERAL::FILE_READ_WRITE,
           .what = "Unable to open configuration file: " + f.string()});
    }
    std::string existing_content((std::istreambuf_iterator<char>(ifs)),
                                 std::istreambuf_iterator<char>());
    boost::system::error_code ec;
    auto jv = json::parse(existing_content, ec);
    if (ec || !jv.is_object()) {
      return monad::MyVoidResult::Err(
          {.code = my_errors::GENERAL::INVALID_ARGUMENT,
           .what = "Configuration file is not a JSON object: " + f.string()});
    }
    merged = jv.as_object();
  }
  merge_json_object(merged, content);

  std::error_code dir_ec;
  fs::create_directories(f.parent_path(), dir_ec);
  std::ofstream ofs(f);
  if (!ofs) {
    return monad::MyVoidResult::Err(
        {.code = my_errors::GENERAL::FILE_READ_WRITE,
         .what = "Unable to open configuration file for writing: " +
                 f.string()});
  }
  ofs << json::serialize(merged) << std::endl;

  json::object current = config_sources_.application_json().value_or(
      json::object{});
  merge_json_object(current, merged);
  config_ = json::value_to<SpeakerctrlConfig>(json::value(current));
  return monad::MyVoidResult::Ok();
}

} // namespace speakerctrl
