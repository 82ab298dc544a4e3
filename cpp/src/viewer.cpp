#include "web.hpp"

const char* const viewer_html = R"html(<!doctype html>
<html>
<head>
<meta charset="utf-8">
<title>tdiff</title>
<style>
body { font-family: sans-serif; margin: 0; display: flex; height: 100vh; }
#tree { width: 30%; overflow: auto; border-right: 1px solid #ccc; padding: 4px; }
#diff { flex: 1; overflow: auto; font-family: monospace; white-space: pre; }
#summary { font-size: small; color: #555; padding: 4px; }
.row { cursor: pointer; white-space: nowrap; }
.row:hover { background: #eef; }
.added { color: #080; } .removed { color: #a00; }
.modified { color: #a60; } .conflicted { color: #a0a; }
table { border-collapse: collapse; width: 100%; }
td { padding: 0 4px; vertical-align: top; }
td.num { color: #999; text-align: right; }
tr.insert td.r, tr.replace td.r { background: #dfd; }
tr.delete td.l, tr.replace td.l { background: #fdd; }
</style>
</head>
<body>
<div id="tree"><div id="summary"></div></div>
<div id="diff"></div>
<script>
const marker = { added: "+", removed: "-", modified: "~", unchanged: " ", conflicted: "!" };

function row(node, depth) {
	const div = document.createElement("div");
	div.className = "row " + node.status;
	const mark = (node.left && node.left.error) || (node.right && node.right.error) ? "?" : marker[node.status];
	div.textContent = mark + " " + " ".repeat(depth * 2) + node.name + (node.is_directory ? "/" : "");
	const box = document.createElement("div");
	box.appendChild(div);
	if(node.is_directory) {
		const kids = document.createElement("div");
		for(const child of node.children) kids.appendChild(row(child, depth + 1));
		box.appendChild(kids);
		div.onclick = () => { kids.hidden = !kids.hidden; };
	} else
		div.onclick = () => show(node.path);
	return box;
}

function cell(text, cls) {
	const td = document.createElement("td");
	td.className = cls;
	td.textContent = text;
	return td;
}

async function show(path) {
	const pane = document.getElementById("diff");
	const res = await (await fetch("/api/file?path=" + encodeURIComponent(path))).json();
	pane.textContent = "";
	if(!res.success) { pane.textContent = res.error; return; }
	const table = document.createElement("table");
	for(const hunk of res.data.hunks) {
		const n = Math.max(hunk.left_lines.length, hunk.right_lines.length);
		for(let i = 0; i < n; ++i) {
			const tr = document.createElement("tr");
			tr.className = hunk.op;
			const l = i < hunk.left_lines.length, r = i < hunk.right_lines.length;
			tr.appendChild(cell(l ? hunk.left.first + i : "", "num"));
			tr.appendChild(cell(l ? hunk.left_lines[i] : "", "l"));
			tr.appendChild(cell(r ? hunk.right.first + i : "", "num"));
			tr.appendChild(cell(r ? hunk.right_lines[i] : "", "r"));
			table.appendChild(tr);
		}
	}
	pane.appendChild(table);
}

async function load() {
	const res = await (await fetch("/api/diff")).json();
	const tree = document.getElementById("tree");
	const s = res.data.summary;
	document.getElementById("summary").textContent = res.data.left_root + " ↔ " + res.data.right_root
		+ ": " + s.added + " added, " + s.removed + " removed, " + s.modified + " modified, "
		+ s.conflicted + " conflicted";
	const root = res.data.root;
	if(root.is_directory)
		for(const child of root.children) tree.appendChild(row(child, 0));
	else
		tree.appendChild(row(root, 0));
}

load();
</script>
</body>
</html>
)html";
