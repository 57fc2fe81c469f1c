#include "infrastructure/ScaffoldTemplates.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <nlohmann/json.hpp>

namespace webforge::infrastructure {

using json = nlohmann::json;

namespace {

std::string Lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

std::string PackageName(const std::string& title) {
    std::string name;
    for (char c : Lower(title)) {
        const bool keep = std::isalnum(static_cast<unsigned char>(c)) || c == '-';
        name += keep ? c : '-';
        if (name.size() == 28) break;
    }
    const auto first = name.find_first_not_of('-');
    const auto last = name.find_last_not_of('-');
    if (first == std::string::npos) return "app";
    return name.substr(first, last - first + 1);
}

std::vector<std::string> WithoutNavbar(const std::vector<std::string>& sections) {
    std::vector<std::string> out;
    for (const auto& s : sections) {
        if (s != "Navbar") out.push_back(s);
    }
    return out;
}

std::string ReplaceAll(std::string text, const std::string& from, const std::string& to) {
    for (auto pos = text.find(from); pos != std::string::npos; pos = text.find(from, pos + to.size())) {
        text.replace(pos, from.size(), to);
    }
    return text;
}

} // namespace

std::string ScaffoldTemplates::PackageJson(const std::string& title) {
    json pkg = {
        {"name", PackageName(title)},
        {"private", true},
        {"version", "0.0.0"},
        {"type", "module"},
        {"scripts", {{"dev", "vite"}, {"build", "vite build"}, {"preview", "vite preview"}}},
        {"dependencies", {
            {"react", "^18.2.0"}, {"react-dom", "^18.2.0"},
            {"framer-motion", "^11.0.0"}, {"react-icons", "^5.0.0"}
        }},
        {"devDependencies", {
            {"@vitejs/plugin-react", "^4.2.0"}, {"autoprefixer", "^10.4.0"},
            {"postcss", "^8.4.0"}, {"tailwindcss", "^3.4.0"}, {"vite", "^5.0.0"}
        }}
    };
    return pkg.dump(2) + "\n";
}

std::string ScaffoldTemplates::ViteConfig() {
    return
        "import { defineConfig } from 'vite'\n"
        "import react from '@vitejs/plugin-react'\n"
        "export default defineConfig({\n"
        "  plugins: [react()],\n"
        "})\n";
}

std::string ScaffoldTemplates::TailwindConfig() {
    return
        "export default {\n"
        "  content: ['./index.html', './src/**/*.{js,ts,jsx,tsx}'],\n"
        "  theme: {\n"
        "    extend: {\n"
        "      colors: { accent: '#6366f1', accent2: '#22d3ee', dark: '#0a0a0f', dark2: '#12121a', card: '#1e1e2e' },\n"
        "      fontFamily: { sans: ['Inter', 'system-ui', 'sans-serif'] },\n"
        "    },\n"
        "  },\n"
        "  plugins: [],\n"
        "}\n";
}

std::string ScaffoldTemplates::PostcssConfig() {
    return "export default { plugins: { tailwindcss: {}, autoprefixer: {} } }\n";
}

std::string ScaffoldTemplates::IndexHtml(const std::string& title) {
    std::ostringstream ss;
    ss << "<!DOCTYPE html>\n"
       << "<html lang=\"en\">\n"
       << "<head>\n"
       << "  <meta charset=\"UTF-8\" />\n"
       << "  <meta name=\"viewport\" content=\"width=device-width,initial-scale=1.0\" />\n"
       << "  <title>" << title << "</title>\n"
       << "</head>\n"
       << "<body>\n"
       << "  <div id=\"root\"></div>\n"
       << "  <script type=\"module\" src=\"/src/main.jsx\"></script>\n"
       << "</body>\n"
       << "</html>\n";
    return ss.str();
}

std::string ScaffoldTemplates::MainJsx() {
    return
        "import React from 'react'\n"
        "import ReactDOM from 'react-dom/client'\n"
        "import App from './App.jsx'\n"
        "import './index.css'\n"
        "\n"
        "ReactDOM.createRoot(document.getElementById('root')).render(\n"
        "  <React.StrictMode>\n"
        "    <App />\n"
        "  </React.StrictMode>\n"
        ")\n";
}

std::string ScaffoldTemplates::IndexCss(const std::string& colorScheme) {
    std::string accent = "#6366f1";
    std::string accent2 = "#22d3ee";
    const std::string scheme = Lower(colorScheme);
    if (scheme.find("red") != std::string::npos) { accent = "#ff4444"; accent2 = "#ff9f43"; }
    else if (scheme.find("green") != std::string::npos) { accent = "#10b981"; accent2 = "#059669"; }
    else if (scheme.find("orange") != std::string::npos) { accent = "#f59e0b"; accent2 = "#ef4444"; }
    else if (scheme.find("pink") != std::string::npos) { accent = "#ec4899"; accent2 = "#8b5cf6"; }
    else if (scheme.find("gold") != std::string::npos || scheme.find("yellow") != std::string::npos) {
        accent = "#fbbf24"; accent2 = "#f59e0b";
    }
    else if (scheme.find("purple") != std::string::npos) { accent = "#a855f7"; accent2 = "#6366f1"; }

    std::ostringstream ss;
    ss << "@tailwind base;\n@tailwind components;\n@tailwind utilities;\n\n"
       << "@layer base {\n"
       << "  * { scroll-behavior: smooth; box-sizing: border-box; }\n"
       << "  html, body, #root { min-height: 100vh; background-color: #0a0a0f; color: #e2e8f0; }\n"
       << "  body { @apply font-sans; }\n"
       << "}\n"
       << "@layer utilities {\n"
       << "  .gradient-text {\n"
       << "    background: linear-gradient(135deg, " << accent << ", " << accent2 << ");\n"
       << "    -webkit-background-clip: text;\n"
       << "    -webkit-text-fill-color: transparent;\n"
       << "    background-clip: text;\n"
       << "  }\n"
       << "  .glass { backdrop-filter: blur(20px); background: rgba(30,30,46,0.55); border: 1px solid rgba(255,255,255,0.08); }\n"
       << "  .glow { box-shadow: 0 0 30px " << accent << "33; border: 1px solid " << accent << "44; }\n"
       << "}\n";
    return ss.str();
}

std::string ScaffoldTemplates::AppShell(const std::string& title, const std::vector<std::string>& sections) {
    const auto body = WithoutNavbar(sections);
    std::ostringstream ss;
    ss << "import { motion } from 'framer-motion'\n"
       << "import Navbar from './components/Navbar'\n";
    for (const auto& s : body) ss << "import " << s << " from './components/" << s << "'\n";
    ss << "\n"
       << "const fadeUp = { hidden: { opacity: 0, y: 40 }, visible: { opacity: 1, y: 0, transition: { duration: 0.65 } } }\n"
       << "\n"
       << "export default function App() {\n"
       << "  return (\n"
       << "    <div className='bg-dark min-h-screen overflow-x-hidden'>\n"
       << "      <Navbar />\n";
    for (const auto& s : body) {
        ss << "      <motion.div id='" << Lower(s) << "' className='py-20 px-6 max-w-7xl mx-auto'\n"
           << "        initial='hidden' whileInView='visible' viewport={{ once: true, amount: 0.08 }} variants={fadeUp}>\n"
           << "        <" << s << " />\n"
           << "      </motion.div>\n";
    }
    ss << "      <footer className='border-t border-white/10 py-6 text-center text-gray-500 text-sm'>\n"
       << "        <p>&copy; " << title << "</p>\n"
       << "      </footer>\n"
       << "    </div>\n"
       << "  )\n"
       << "}\n";
    return ss.str();
}

std::string ScaffoldTemplates::SingleAppShell() {
    return
        "import AppComponent from './components/App'\n"
        "export default function App() {\n"
        "  return (\n"
        "    <div className='min-h-screen overflow-x-hidden'>\n"
        "      <AppComponent />\n"
        "    </div>\n"
        "  )\n"
        "}\n";
}

std::string ScaffoldTemplates::SafeComponent(const std::string& name) {
    const std::string tmpl =
        "import { motion } from 'framer-motion'\n"
        "export default function {name}() {\n"
        "  return (\n"
        "    <section id='{id}' className='py-20 px-6 bg-gray-900'>\n"
        "      <motion.div className='max-w-4xl mx-auto text-center'\n"
        "        initial={{ opacity: 0, y: 30 }} whileInView={{ opacity: 1, y: 0 }}\n"
        "        transition={{ duration: 0.6 }} viewport={{ once: true }}>\n"
        "        <h2 className='text-5xl font-black mb-4 gradient-text'>{name}</h2>\n"
        "        <p className='text-gray-400 text-lg'>Section content goes here.</p>\n"
        "      </motion.div>\n"
        "    </section>\n"
        "  )\n"
        "}\n";
    return ReplaceAll(ReplaceAll(tmpl, "{name}", name), "{id}", Lower(name));
}

std::string ScaffoldTemplates::FallbackNavbar(const std::string& title, const std::vector<std::string>& sections) {
    const auto links = WithoutNavbar(sections);
    std::ostringstream ss;
    ss << "import { useState, useEffect } from 'react'\n"
       << "export default function Navbar() {\n"
       << "  const [scrolled, setScrolled] = useState(false)\n"
       << "  const [open, setOpen] = useState(false)\n"
       << "  useEffect(() => {\n"
       << "    const onScroll = () => setScrolled(window.scrollY > 50)\n"
       << "    window.addEventListener('scroll', onScroll)\n"
       << "    return () => window.removeEventListener('scroll', onScroll)\n"
       << "  }, [])\n"
       << "  const links = [";
    for (size_t i = 0; i < links.size(); ++i) {
        ss << (i ? ", " : "") << "'" << links[i] << "'";
    }
    ss << "]\n"
       << "  return (\n"
       << "    <nav className={`fixed top-0 w-full z-50 transition-all ${scrolled ? 'backdrop-blur-xl bg-black/60' : 'bg-transparent'}`}>\n"
       << "      <div className='max-w-7xl mx-auto px-6 py-4 flex justify-between items-center'>\n"
       << "        <a href='#' className='text-xl font-black gradient-text'>" << title << "</a>\n"
       << "        <div className='hidden md:flex gap-8'>\n"
       << "          {links.map(l => (\n"
       << "            <a key={l} href={'#' + l.toLowerCase()} className='text-sm text-gray-400 hover:text-white uppercase'>{l}</a>\n"
       << "          ))}\n"
       << "        </div>\n"
       << "        <button className='md:hidden text-white text-xl' onClick={() => setOpen(!open)}>&#9776;</button>\n"
       << "      </div>\n"
       << "      {open && (\n"
       << "        <div className='md:hidden bg-black/90 px-6 py-4 flex flex-col gap-3'>\n"
       << "          {links.map(l => (\n"
       << "            <a key={l} href={'#' + l.toLowerCase()} onClick={() => setOpen(false)} className='text-gray-300 py-2'>{l}</a>\n"
       << "          ))}\n"
       << "        </div>\n"
       << "      )}\n"
       << "    </nav>\n"
       << "  )\n"
       << "}\n";
    return ss.str();
}

} // namespace webforge::infrastructure
