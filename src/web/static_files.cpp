#include "web/static_files.hpp"

namespace web {

const std::string& index_html() {
    static const std::string html = R"(<!DOCTYPE html>
<html lang="en">
<head>
<meta charset="UTF-8">
<meta name="viewport" content="width=device-width, initial-scale=1.0">
<title>lanshare</title>
<style>
body { font-family: sans-serif; max-width: 760px; margin: 0 auto; padding: 20px; color: #222; }
li { display: flex; justify-content: space-between; padding: 6px 0; border-bottom: 1px solid #eee; }
</style>
</head>
<body>
<h1>lanshare</h1>
<p id="device"></p>
<form id="upload"><input type="file" name="file" required> <button>Upload</button></form>
<h2>Files</h2>
<ul id="files"></ul>
<h2>Nearby devices</h2>
<button id="scan">Scan</button>
<ul id="peers"></ul>
<script>
async function refresh() {
  const files = await (await fetch('/api/files')).json();
  document.getElementById('files').innerHTML = files.map(f =>
    `<li><a href="/api/files/${f.id}">${f.name}</a><span>${f.size_human}</span></li>`).join('');
}
document.getElementById('upload').onsubmit = async (e) => {
  e.preventDefault();
  await fetch('/api/files', { method: 'POST', body: new FormData(e.target) });
  e.target.reset();
  refresh();
};
document.getElementById('scan').onclick = async () => {
  const peers = await (await fetch('/api/discover')).json();
  document.getElementById('peers').innerHTML = peers.map(p =>
    `<li><a href="http://${p.ip}:${p.port}/">${p.name}</a><span>${p.os}</span></li>`).join('');
};
fetch('/api/device').then(r => r.json()).then(d => {
  document.getElementById('device').textContent = `${d.name} (${d.os}) at ${d.ip}:${d.port}`;
});
refresh();
</script>
</body>
</html>
)";
    return html;
}

} // namespace web
