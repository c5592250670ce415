#include "json_table/artifact_writer.hpp"
#include "json_table/mustache_renderer.hpp"
#include <filesystem>
#include <fstream>

namespace jt {

bool write_table_dir(const std::string& artifact_root,
                     const std::string& slug,
                     const TableDocument& doc,
                     const std::string& table_json_str,
                     const std::string& template_dir,
                     std::string* err_out) {
  if (slug.empty()) {
    if (err_out) *err_out = "empty artifact slug";
    return false;
  }
  const std::filesystem::path out_dir =
      std::filesystem::path(artifact_root) / slug;

  // (A) table.json next to table.html
  {
    std::error_code ec;
    std::filesystem::create_directories(out_dir, ec);
    if (ec) {
      if (err_out) *err_out = "cannot create " + out_dir.string() + ": " + ec.message();
      return false;
    }
    std::ofstream tj(out_dir / "table.json", std::ios::binary);
    if (!tj) {
      if (err_out) *err_out = "failed to write table.json";
      return false;
    }
    tj.write(table_json_str.data(),
             static_cast<std::streamsize>(table_json_str.size()));
  }

  // (B) table.html + CSS
  jt::MustacheRenderer::Config rcfg;
  if (!template_dir.empty()) {
    rcfg.template_dir = template_dir;
  } else {
#ifdef JT_DEFAULT_TEMPLATE_DIR
    rcfg.template_dir = JT_DEFAULT_TEMPLATE_DIR;
#else
    rcfg.template_dir = "templates";
#endif
  }
  rcfg.partials_dir = rcfg.template_dir + "/partials";
  rcfg.static_css   = {"web/css/table.css"};

  jt::MustacheRenderer renderer(rcfg);
  const bool ok = renderer.render_to_dir("table.mustache",
                                         doc,
                                         out_dir.string(),
                                         "table.html",
                                         /*copy_assets=*/true);
  // on success, last_error() carries asset warnings only
  if (err_out) *err_out = renderer.last_error();
  return ok;
}

}
