#include "json_table/mustache_renderer.hpp"
#include "json_table/path_utils.hpp"
#include "json_table/row_limit.hpp"

#if __has_include(<kainjow/mustache.hpp>)
  #include <kainjow/mustache.hpp>
#elif __has_include(<mustache.hpp>)
  #include <mustache.hpp>
#else
  #error "kainjow/Mustache header not found"
#endif

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>
#include <cctype>

namespace jt {

using kainjow::mustache::data;

MustacheRenderer::MustacheRenderer() : cfg_{} {}

static std::string read_file(const std::string& path, std::string& err) {
  std::ifstream in(path, std::ios::binary);
  if (!in) { err += "open failed: " + path + "\n"; return {}; }
  std::ostringstream ss; ss << in.rdbuf();
  return ss.str();
}

// naive "{{> name}}" inliner that looks for partial files in cfg_.partials_dir
static std::string inline_partials(std::string tpl,
                                   const std::filesystem::path& partials_dir,
                                   std::string& err) {
  size_t pos = 0;
  while ((pos = tpl.find("{{>", pos)) != std::string::npos) {
    size_t name_start = pos + 3;
    while (name_start < tpl.size() && std::isspace(static_cast<unsigned char>(tpl[name_start])))
      ++name_start;
    size_t close = tpl.find("}}", name_start);
    if (close == std::string::npos) break;

    size_t name_end = close;
    while (name_end > name_start &&
           std::isspace(static_cast<unsigned char>(tpl[name_end - 1])))
      --name_end;

    std::string partial_name = tpl.substr(name_start, name_end - name_start);
    if (partial_name.empty()) { pos = close + 2; continue; }

    // allow both "<name>" and "<name>.mustache"
    std::string perr;
    std::filesystem::path p1 = partials_dir / partial_name;
    std::filesystem::path p2 = partials_dir / (partial_name + ".mustache");

    std::string content = read_file(p1.string(), perr);
    if (content.empty()) content = read_file(p2.string(), perr);
    if (content.empty()) {
      err += "partial not found: " + p1.string() + " | " + p2.string() + "\n";
      pos = close + 2;
      continue;
    }

    tpl.replace(pos, (close + 2) - pos, content);
    pos += content.size();
  }
  return tpl;
}

// missing assets are reported in `err` but never fail a render
static void copy_one_asset(const std::filesystem::path& src_hint,
                           const std::filesystem::path& out_dir,
                           std::string& err) {
  std::error_code ec;

  std::vector<std::filesystem::path> candidates;
  candidates.emplace_back(src_hint);

#ifdef JT_DEFAULT_STATIC_DIR
  {
    std::filesystem::path base(JT_DEFAULT_STATIC_DIR);
    candidates.emplace_back(base / src_hint.filename());
    candidates.emplace_back(base / src_hint);
  }
#endif

  std::filesystem::path src{};
  for (auto& c : candidates) {
    if (std::filesystem::exists(c, ec)) { src = c; break; }
  }

  if (src.empty()) {
    err += "asset not found: " + src_hint.string() + "\n";
    return;
  }

  std::filesystem::create_directories(out_dir, ec);
  if (ec) {
    err += "cannot ensure out_dir: " + out_dir.string() + "\n";
    return;
  }

  auto dst = out_dir / src.filename();
  std::filesystem::copy_file(src, dst,
      std::filesystem::copy_options::overwrite_existing, ec);
  if (ec) {
    err += "copy failed: " + src.string() + " -> " + dst.string() + " (" + ec.message() + ")\n";
  }
}

static data cells_of(const Row& row, std::size_t width) {
  data cells{data::type::list};
  for (std::size_t i = 0; i < width; ++i) {
    cells.push_back(data(i < row.size() ? row[i] : std::string{}));
  }
  return cells;
}

static data make_context(const TableDocument& doc) {
  data ctx;
  ctx.set("title", doc.title);
  ctx.set("source", doc.source);

  data notes{data::type::list};
  for (const auto& n : doc.notes) {
    data item;
    item.set("level", std::string(to_string(n.level)));
    item.set("message", n.message);
    notes.push_back(item);
  }
  ctx.set("has_notes", data(!doc.notes.empty()));
  ctx.set("notes", notes);

  if (!doc.error.empty()) {
    ctx.set("has_error", data(true));
    ctx.set("error", doc.error);
    return ctx;
  }
  ctx.set("has_error", data(false));

  const std::size_t width = std::max<std::size_t>(max_width(doc.table), 1);
  const bool has_header = doc.include_header && !doc.table.empty();

  ctx.set("has_header", data(has_header));
  if (has_header) ctx.set("header", cells_of(doc.table.front(), width));

  data rows{data::type::list};
  for (std::size_t i = has_header ? 1 : 0; i < doc.table.size(); ++i) {
    data r;
    r.set("cells", cells_of(doc.table[i], width));
    rows.push_back(r);
  }
  const bool empty = (doc.table.size() == (has_header ? 1u : 0u));
  ctx.set("is_empty", data(empty));
  ctx.set("rows", rows);
  ctx.set("columns", std::to_string(width));
  ctx.set("row_count", format_count(doc.conversion.emitted_rows));
  ctx.set("source_rows", format_count(doc.conversion.source_rows));
  ctx.set("truncated", data(doc.conversion.truncated));
  return ctx;
}

MustacheRenderer::MustacheRenderer(Config cfg) : cfg_(std::move(cfg)) {}

bool MustacheRenderer::render_to_string(std::string_view template_name,
                                        const TableDocument& doc,
                                        std::string& out) {
  err_.clear();

  const auto tpl_path =
      (std::filesystem::path(cfg_.template_dir) / std::string(template_name)).string();

  std::string tpl = read_file(tpl_path, err_);
  if (tpl.empty() && !err_.empty()) return false;

  // expand partials before handing to the engine
  tpl = inline_partials(std::move(tpl), std::filesystem::path(cfg_.partials_dir), err_);

  kainjow::mustache::mustache view(tpl);
  if (!view.is_valid()) { err_ = view.error_message(); return false; }

  out = view.render(make_context(doc));
  if (!view.is_valid()) { err_ = view.error_message(); return false; }
  return true;
}

bool MustacheRenderer::render_to_file(std::string_view template_name,
                                      const TableDocument& doc,
                                      std::string_view out_path) {
  std::string rendered;
  if (!render_to_string(template_name, doc, rendered)) return false;

  if (!ensure_parent_dirs(std::filesystem::path(out_path))) { err_ = "mkdir -p failed"; return false; }

  std::ofstream out(std::string(out_path), std::ios::binary);
  if (!out) { err_ = "write failed: " + std::string(out_path); return false; }
  out.write(rendered.data(), static_cast<std::streamsize>(rendered.size()));
  return true;
}

bool MustacheRenderer::render_to_dir(std::string_view template_name,
                                     const TableDocument& doc,
                                     std::string_view out_dir,
                                     std::string_view out_name,
                                     bool copy_assets) {
  err_.clear();
  const std::filesystem::path outdir{std::string(out_dir)};
  const std::filesystem::path outpath = outdir / std::string(out_name);

  if (!render_to_file(template_name, doc, outpath.string())) {
    return false; // err_ set
  }
  if (!copy_assets) return true;

  std::vector<std::string> css = cfg_.static_css.empty()
      ? std::vector<std::string>{"web/css/table.css"}
      : cfg_.static_css;

  for (auto& s : css) copy_one_asset(std::filesystem::path(s), outdir, err_);

  return true;
}

}
