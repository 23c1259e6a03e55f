#include <QApplication>
#include <QLineEdit>
#include <QLabel>
#include <QVBoxLayout>
#include <QWidget>

#include <steady/steady.hpp>
#include <steady/adapters/qt.hpp>

#include <string>

using namespace steady;

int main(int argc, char** argv) {
  QApplication app(argc, argv);

  // ----- UI -----
  QWidget window;
  window.setWindowTitle("steady × Qt | Search Demo");

  auto* input  = new QLineEdit;
  auto* status = new QLabel;
  auto* length = new QLabel;

  auto* layout = new QVBoxLayout;
  layout->addWidget(new QLabel("Search:"));
  layout->addWidget(input);
  layout->addSpacing(8);
  layout->addWidget(status);
  layout->addSpacing(8);
  layout->addWidget(length);
  window.setLayout(layout);
  window.resize(360, 160);
  window.show();

  // ----- Reactive: the line edit as a property -----
  thread_pool pool{1};
  auto text = qt::property_from_signal(QString(), input, &QLineEdit::textChanged)
    .map([](const QString& s){ return s.trimmed().toStdString(); });

  // search on the pool, newest query wins, show on the UI thread
  auto result = text
    .filter(std::string(), [](const std::string& s){ return s.size() >= 2; })
    .remove_duplicates()
    .flat_map([&pool](const std::string& q){
      if (q.empty()) return property<std::string>(std::string("type at least 2 chars…"));
      return property<std::string>("searching…", just("[query] " + q) | observe_on(pool));
    })
    | qt::receive_on(status);

  // the label shows the current value right away, then follows
  auto sub_status = result.values_with_current().subscribe([status](const std::string& s){
    status->setText(QString::fromStdString(s));
  });
  auto sub_length = text.map([](const std::string& s){ return s.size(); })
    .values_with_current().subscribe([length](std::size_t n){
      length->setText(QString("chars: %1").arg(n));
    });

  return app.exec();
}
